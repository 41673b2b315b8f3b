#pragma once

#include "spantag/converter/context.hpp"
#include "spantag/converter/events.hpp"
#include "spantag/types.hpp"

namespace spantag::converter::guard {

struct valid_convert {
  bool operator()(const event::convert & ev, const action::context &) const noexcept {
    if (ev.tags_out == nullptr || ev.error_out == nullptr) {
      return false;
    }
    return is_known_scheme(ev.source) && is_known_scheme(ev.target) &&
           is_known_policy(ev.policy);
  }
};

struct invalid_convert {
  bool operator()(const event::convert & ev, const action::context & ctx) const noexcept {
    return !valid_convert{}(ev, ctx);
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

}  // namespace spantag::converter::guard
