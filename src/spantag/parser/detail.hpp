#pragma once

#include <cstddef>
#include <cstdint>

#include "spantag/parser/context.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/reader/context.hpp"
#include "spantag/reader/dispatch.hpp"
#include "spantag/reader/sm.hpp"
#include "spantag/scheme/detail.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::parser::detail {

inline void clear_outputs(const event::parse & ev) noexcept {
  if (ev.spans_out != nullptr) {
    ev.spans_out->clear();
  }
  if (ev.repairs_out != nullptr) {
    ev.repairs_out->clear();
  }
}

/**
 * Decodes every tag up front so a malformed tag fails the request before any
 * transition is judged, whatever the policy.
 */
inline int32_t decode_all(const event::parse & ev, action::context & ctx) {
  ctx.decoded.resize(ev.tags.size());
  for (size_t i = 0; i < ev.tags.size(); ++i) {
    const int32_t err = scheme::detail::decode_tag(ev.scheme, ev.tags[i], ctx.decoded[i]);
    if (err == SPANTAG_OK) {
      continue;
    }
    if (ev.detail_out != nullptr) {
      ev.detail_out->status = err;
      ev.detail_out->index = static_cast<int32_t>(i);
      ev.detail_out->current = ev.tags[i];
    }
    return err;
  }
  return SPANTAG_OK;
}

/**
 * Runs the token-level reader over the decoded tags and leaves the spans in
 * `ev.spans_out`. On failure every output is cleared.
 */
inline int32_t read_spans(const event::parse & ev, action::context & ctx) {
  clear_outputs(ev);
  ctx.span_count = 0;
  ctx.repair_count = 0;
  if (ev.detail_out != nullptr) {
    ev.detail_out->reset();
  }

  int32_t err = decode_all(ev, ctx);
  if (err != SPANTAG_OK) {
    return err;
  }

  reader::action::context reader_ctx{};
  reader_ctx.scheme = ev.scheme;
  reader_ctx.policy = ev.policy;
  reader_ctx.spans_out = ev.spans_out;
  reader_ctx.repairs_out = ev.repairs_out;
  reader_ctx.detail_out = ev.detail_out;
  reader::sm machine{reader_ctx};

  const int32_t length = static_cast<int32_t>(ctx.decoded.size());
  for (int32_t i = 0; i < length && err == SPANTAG_OK; ++i) {
    const size_t slot = static_cast<size_t>(i);
    if (!reader::step(machine, i, ctx.decoded[slot], ev.tags[slot])) {
      err = SPANTAG_ERR_BACKEND;
    } else {
      err = reader_ctx.phase_error;
    }
  }
  if (err == SPANTAG_OK) {
    if (!reader::finish(machine, length)) {
      err = SPANTAG_ERR_BACKEND;
    } else {
      err = reader_ctx.phase_error;
    }
  }

  if (err != SPANTAG_OK) {
    clear_outputs(ev);
    if (ev.detail_out != nullptr && ev.detail_out->status == SPANTAG_OK) {
      ev.detail_out->status = err;
    }
    return err;
  }

  ctx.span_count = static_cast<int32_t>(ev.spans_out->size());
  ctx.repair_count = reader_ctx.repair_count;
  return SPANTAG_OK;
}

}  // namespace spantag::parser::detail
