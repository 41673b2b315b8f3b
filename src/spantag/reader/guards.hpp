#pragma once

#include "spantag/reader/context.hpp"
#include "spantag/reader/events.hpp"
#include "spantag/transition/table.hpp"

namespace spantag::reader::guard {

struct transition_legal {
  template <class Event>
  bool operator()(const Event & ev, const action::context & ctx) const noexcept {
    return transition::allows(ctx.scheme, ctx.previous, ev.value);
  }
};

struct transition_accepted {
  template <class Event>
  bool operator()(const Event & ev, const action::context & ctx) const noexcept {
    return ctx.policy != repair_policy::strict || transition_legal{}(ev, ctx);
  }
};

struct transition_rejected {
  template <class Event>
  bool operator()(const Event & ev, const action::context & ctx) const noexcept {
    return !transition_accepted{}(ev, ctx);
  }
};

}  // namespace spantag::reader::guard
