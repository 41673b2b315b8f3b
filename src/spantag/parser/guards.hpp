#pragma once

#include "spantag/parser/context.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/types.hpp"

namespace spantag::parser::guard {

struct valid_parse {
  bool operator()(const event::parse & ev, const action::context &) const noexcept {
    if (ev.spans_out == nullptr || ev.error_out == nullptr) {
      return false;
    }
    if (!is_known_scheme(ev.scheme) || !is_known_policy(ev.policy)) {
      return false;
    }
    return true;
  }
};

struct invalid_parse {
  bool operator()(const event::parse & ev, const action::context & ctx) const noexcept {
    return !valid_parse{}(ev, ctx);
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

}  // namespace spantag::parser::guard
