#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <span>

#include "spantag/encoder/context.hpp"
#include "spantag/encoder/events.hpp"
#include "spantag/scheme/detail.hpp"
#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::encoder::detail {

inline int32_t covering_length(std::span<const span> spans) noexcept {
  int32_t out = 0;
  for (const span & s : spans) {
    out = std::max(out, s.end);
  }
  return out;
}

inline int32_t fail(const event::encode & ev, const int32_t err, const int32_t index) {
  if (ev.detail_out != nullptr) {
    ev.detail_out->status = err;
    ev.detail_out->index = index;
    if (index >= 0 && static_cast<size_t>(index) < ev.spans.size()) {
      ev.detail_out->current = ev.spans[static_cast<size_t>(index)].type;
    }
  }
  return err;
}

inline int32_t check_span(const span & s, const int32_t length) noexcept {
  if (s.type.empty()) {
    return SPANTAG_ERR_INVALID_ARGUMENT;
  }
  if (s.start < 0 || s.end > length || s.start > s.end) {
    return SPANTAG_ERR_OUT_OF_RANGE;
  }
  if (s.start == s.end) {
    return SPANTAG_ERR_INVALID_ARGUMENT;
  }
  return SPANTAG_OK;
}

/**
 * Validates the spans, orders them by start and rejects shared tokens.
 * `ctx.order` holds the ordering on success.
 */
inline int32_t order_spans(const event::encode & ev, const int32_t length,
                           action::context & ctx) {
  const int32_t count = static_cast<int32_t>(ev.spans.size());
  for (int32_t i = 0; i < count; ++i) {
    const int32_t err = check_span(ev.spans[static_cast<size_t>(i)], length);
    if (err != SPANTAG_OK) {
      return fail(ev, err, i);
    }
  }

  ctx.order.resize(ev.spans.size());
  std::iota(ctx.order.begin(), ctx.order.end(), 0);
  std::stable_sort(ctx.order.begin(), ctx.order.end(), [&](const int32_t lhs, const int32_t rhs) {
    return ev.spans[static_cast<size_t>(lhs)].start < ev.spans[static_cast<size_t>(rhs)].start;
  });

  for (size_t k = 1; k < ctx.order.size(); ++k) {
    const span & previous = ev.spans[static_cast<size_t>(ctx.order[k - 1])];
    const span & current = ev.spans[static_cast<size_t>(ctx.order[k])];
    if (current.start < previous.end) {
      return fail(ev, SPANTAG_ERR_OVERLAP, ctx.order[k]);
    }
  }
  return SPANTAG_OK;
}

/**
 * Renders ordered spans into `ev.tags_out`. IOB writes its separator marker
 * on the first token of a span that directly follows a span of the same
 * type; every other scheme marks positions only.
 */
inline int32_t write_tags(const event::encode & ev, action::context & ctx) {
  ev.tags_out->clear();
  ctx.tag_count = 0;
  if (ev.detail_out != nullptr) {
    ev.detail_out->reset();
  }

  const int32_t length = ev.token_count >= 0 ? ev.token_count : covering_length(ev.spans);
  const int32_t err = order_spans(ev, length, ctx);
  if (err != SPANTAG_OK) {
    return err;
  }

  const scheme::descriptor & desc = scheme::describe(ev.scheme);
  ev.tags_out->assign(static_cast<size_t>(length), scheme::detail::render_outside());

  const span * previous = nullptr;
  for (const int32_t index : ctx.order) {
    const span & current = ev.spans[static_cast<size_t>(index)];
    const bool separated = desc.separator != '\0' && previous != nullptr &&
                           previous->end == current.start && previous->type == current.type;
    for (int32_t token = current.start; token < current.end; ++token) {
      char marker = scheme::detail::marker_for(
          ev.scheme, scheme::detail::position_in_span(token, current.start, current.end));
      if (token == current.start && separated) {
        marker = desc.separator;
      }
      (*ev.tags_out)[static_cast<size_t>(token)] = scheme::detail::render_tag(marker, current.type);
    }
    previous = &current;
  }

  ctx.tag_count = length;
  return SPANTAG_OK;
}

}  // namespace spantag::encoder::detail
