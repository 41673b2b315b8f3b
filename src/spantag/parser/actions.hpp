#pragma once

#include <cstdint>

#include "spantag/parser/context.hpp"
#include "spantag/parser/detail.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/spantag.h"

namespace spantag::parser::action {

namespace detail {

inline void dispatch_done(const event::parse & ev, const context & ctx) {
  if (ev.dispatch_done == nullptr || ev.owner_sm == nullptr) {
    return;
  }
  ev.dispatch_done(ev.owner_sm, events::parsing_done{&ev, ctx.span_count, ctx.repair_count});
}

inline void dispatch_error(const event::parse & ev, const int32_t err) {
  if (ev.dispatch_error == nullptr || ev.owner_sm == nullptr) {
    return;
  }
  ev.dispatch_error(ev.owner_sm, events::parsing_error{&ev, err});
}

inline int32_t rejection_status(const event::parse & ev) noexcept {
  if (ev.spans_out != nullptr && ev.error_out != nullptr && !is_known_scheme(ev.scheme)) {
    return SPANTAG_ERR_UNKNOWN_SCHEME;
  }
  return SPANTAG_ERR_INVALID_ARGUMENT;
}

}  // namespace detail

struct reject_invalid_parse {
  void operator()(const event::parse & ev, context & ctx) const {
    const int32_t err = detail::rejection_status(ev);
    ctx.span_count = 0;
    ctx.repair_count = 0;
    ctx.phase_error = err;
    ctx.last_error = err;
    parser::detail::clear_outputs(ev);
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

struct run_parse {
  void operator()(const event::parse & ev, context & ctx) const {
    ctx.phase_error = SPANTAG_OK;
    ctx.last_error = SPANTAG_OK;
    *ev.error_out = SPANTAG_OK;

    ctx.phase_error = parser::detail::read_spans(ev, ctx);
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

inline constexpr reject_invalid_parse reject_invalid_parse{};
inline constexpr run_parse run_parse{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace spantag::parser::action
