#pragma once

#include <cstdint>

#include "spantag/encoder/context.hpp"
#include "spantag/encoder/detail.hpp"
#include "spantag/encoder/events.hpp"
#include "spantag/spantag.h"

namespace spantag::encoder::action {

namespace detail {

inline void dispatch_done(const event::encode & ev, const int32_t tag_count) {
  if (ev.dispatch_done == nullptr || ev.owner_sm == nullptr) {
    return;
  }
  ev.dispatch_done(ev.owner_sm, events::encoding_done{&ev, tag_count});
}

inline void dispatch_error(const event::encode & ev, const int32_t err) {
  if (ev.dispatch_error == nullptr || ev.owner_sm == nullptr) {
    return;
  }
  ev.dispatch_error(ev.owner_sm, events::encoding_error{&ev, err});
}

}  // namespace detail

struct reject_invalid_encode {
  void operator()(const event::encode & ev, context & ctx) const {
    const int32_t err = ev.tags_out != nullptr && ev.error_out != nullptr
                            ? SPANTAG_ERR_UNKNOWN_SCHEME
                            : SPANTAG_ERR_INVALID_ARGUMENT;
    ctx.tag_count = 0;
    ctx.phase_error = err;
    ctx.last_error = err;
    if (ev.tags_out != nullptr) {
      ev.tags_out->clear();
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

struct run_encode {
  void operator()(const event::encode & ev, context & ctx) const {
    ctx.phase_error = encoder::detail::write_tags(ev, ctx);
    ctx.last_error = ctx.phase_error;
    *ev.error_out = ctx.phase_error;

    if (ctx.phase_error != SPANTAG_OK) {
      ev.tags_out->clear();
      ctx.tag_count = 0;
      detail::dispatch_error(ev, ctx.phase_error);
      return;
    }
    detail::dispatch_done(ev, ctx.tag_count);
  }
};

struct on_unexpected {
  template <class Event>
  void operator()(const Event &, context & ctx) const noexcept {
    ctx.phase_error = SPANTAG_ERR_BACKEND;
    ctx.last_error = SPANTAG_ERR_BACKEND;
  }
};

inline constexpr reject_invalid_encode reject_invalid_encode{};
inline constexpr run_encode run_encode{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace spantag::encoder::action
