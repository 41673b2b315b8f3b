#pragma once

#include <cstdint>

#include "spantag/converter/context.hpp"
#include "spantag/converter/detail.hpp"
#include "spantag/converter/events.hpp"
#include "spantag/spantag.h"

namespace spantag::converter::action {

namespace detail {

inline void dispatch_done(const event::convert & ev, const context & ctx) {
  if (ev.dispatch_done == nullptr || ev.owner_sm == nullptr) {
    return;
  }
  ev.dispatch_done(ev.owner_sm, events::converting_done{&ev, ctx.span_count, ctx.tag_count});
}

inline void dispatch_error(const event::convert & ev, const int32_t err) {
  if (ev.dispatch_error == nullptr || ev.owner_sm == nullptr) {
    return;
  }
  ev.dispatch_error(ev.owner_sm, events::converting_error{&ev, err});
}

inline int32_t rejection_status(const event::convert & ev) noexcept {
  if (ev.tags_out == nullptr || ev.error_out == nullptr) {
    return SPANTAG_ERR_INVALID_ARGUMENT;
  }
  if (!is_known_scheme(ev.source) || !is_known_scheme(ev.target)) {
    return SPANTAG_ERR_UNKNOWN_SCHEME;
  }
  return SPANTAG_ERR_INVALID_ARGUMENT;
}

}  // namespace detail

struct reject_invalid_convert {
  void operator()(const event::convert & ev, context & ctx) const {
    const int32_t err = detail::rejection_status(ev);
    ctx.span_count = 0;
    ctx.tag_count = 0;
    ctx.phase_error = err;
    ctx.last_error = err;
    if (ev.tags_out != nullptr) {
      ev.tags_out->clear();
    }
    if (ev.repairs_out != nullptr) {
      ev.repairs_out->clear();
    }
    if (ev.error_out != nullptr) {
      *ev.error_out = err;
    }
    if (ev.detail_out != nullptr) {
      ev.detail_out->reset();
      ev.detail_out->status = err;
    }
    detail::dispatch_error(ev, err);
  }
};

struct run_convert {
  void operator()(const event::convert & ev, context & ctx) const {
    ctx.phase_error = converter::detail::convert_tags(ev, ctx);
    ctx.last_error = ctx.phase_error;
    *ev.error_out = ctx.phase_error;

    if (ctx.phase_error == SPANTAG_OK) {
      detail::dispatch_done(ev, ctx);
    } else {
      detail::dispatch_error(ev, ctx.phase_error);
    }
  }
};

struct on_unexpected {
  template <class Event>
  void operator()(const Event &, context & ctx) const noexcept {
    ctx.phase_error = SPANTAG_ERR_BACKEND;
    ctx.last_error = SPANTAG_ERR_BACKEND;
  }
};

inline constexpr reject_invalid_convert reject_invalid_convert{};
inline constexpr run_convert run_convert{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace spantag::converter::action
