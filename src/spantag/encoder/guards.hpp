#pragma once

#include "spantag/encoder/context.hpp"
#include "spantag/encoder/events.hpp"
#include "spantag/types.hpp"

namespace spantag::encoder::guard {

struct valid_encode {
  bool operator()(const event::encode & ev, const action::context &) const noexcept {
    if (ev.tags_out == nullptr || ev.error_out == nullptr) {
      return false;
    }
    return is_known_scheme(ev.scheme);
  }
};

struct invalid_encode {
  bool operator()(const event::encode & ev, const action::context & ctx) const noexcept {
    return !valid_encode{}(ev, ctx);
  }
};

struct phase_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == SPANTAG_OK;
  }
};

struct phase_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != SPANTAG_OK;
  }
};

}  // namespace spantag::encoder::guard
