#pragma once

#include <cstdint>

#include "spantag/reader/context.hpp"
#include "spantag/reader/events.hpp"
#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"
#include "spantag/transition/table.hpp"
#include "spantag/types.hpp"

namespace spantag::reader::action {

namespace detail {

template <class Event>
repair_kind classify(const Event & ev, const context & ctx) noexcept {
  switch (ev.value.kind) {
    case scheme::role::inside:
      return repair_kind::inside_as_begin;
    case scheme::role::end:
      return repair_kind::end_as_single;
    case scheme::role::begin:
      if (!scheme::describe(ctx.scheme).explicit_boundary) {
        return repair_kind::unexpected_begin;
      }
      return repair_kind::unclosed_span;
    default:
      return repair_kind::unclosed_span;
  }
}

// Counts an illegal transition and records it when the policy reports repairs.
template <class Event>
void audit(const Event & ev, context & ctx) {
  if (transition::allows(ctx.scheme, ctx.previous, ev.value)) {
    return;
  }
  ctx.repair_count += 1;
  if (ctx.policy != repair_policy::keep_going || ctx.repairs_out == nullptr) {
    return;
  }
  ctx.repairs_out->push_back(repair{ev.index, classify(ev, ctx), ctx.previous_text, ev.text});
}

template <class Event>
void remember(const Event & ev, context & ctx) noexcept {
  ctx.previous = ev.value;
  ctx.previous_text = ev.text;
}

template <class Event>
void open(const Event & ev, context & ctx) noexcept {
  ctx.open_type = ev.value.type;
  ctx.open_start = ev.index;
}

inline void close(context & ctx, const int32_t end) {
  if (ctx.spans_out != nullptr && ctx.open_start >= 0) {
    ctx.spans_out->push_back(make_span(ctx.open_type, ctx.open_start, end));
  }
  ctx.open_type = {};
  ctx.open_start = -1;
}

template <class Event>
void emit_single(const Event & ev, context & ctx) {
  if (ctx.spans_out != nullptr) {
    ctx.spans_out->push_back(make_span(ev.value.type, ev.index, ev.index + 1));
  }
}

template <class Event>
bool continues_open(const Event & ev, const context & ctx) noexcept {
  return ctx.open_start >= 0 && ctx.open_type == ev.value.type;
}

}  // namespace detail

struct skip_outside {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::remember(ev, ctx);
  }
};

struct open_span {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::open(ev, ctx);
    detail::remember(ev, ctx);
  }
};

struct emit_single {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::emit_single(ev, ctx);
    detail::remember(ev, ctx);
  }
};

struct close_span {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::close(ctx, ev.index);
    detail::remember(ev, ctx);
  }
};

struct reopen_span {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::close(ctx, ev.index);
    detail::open(ev, ctx);
    detail::remember(ev, ctx);
  }
};

struct continue_span {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    if (!detail::continues_open(ev, ctx)) {
      detail::close(ctx, ev.index);
      detail::open(ev, ctx);
    }
    detail::remember(ev, ctx);
  }
};

struct finish_span {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    if (detail::continues_open(ev, ctx)) {
      detail::close(ctx, ev.index + 1);
    } else {
      detail::close(ctx, ev.index);
      detail::emit_single(ev, ctx);
    }
    detail::remember(ev, ctx);
  }
};

struct close_and_emit_single {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::close(ctx, ev.index);
    detail::emit_single(ev, ctx);
    detail::remember(ev, ctx);
  }
};

struct flush_span {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
    detail::close(ctx, ev.index);
  }
};

struct finish_sequence {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const {
    detail::audit(ev, ctx);
  }
};

struct reject_transition {
  template <class Event>
  void operator()(const Event & ev, context & ctx) const noexcept {
    ctx.phase_error = SPANTAG_ERR_INVALID_TRANSITION;
    if (ctx.detail_out == nullptr) {
      return;
    }
    ctx.detail_out->status = SPANTAG_ERR_INVALID_TRANSITION;
    ctx.detail_out->index = ev.index;
    ctx.detail_out->previous = ctx.previous_text;
    ctx.detail_out->current = ev.text;
  }
};

inline constexpr skip_outside skip_outside{};
inline constexpr open_span open_span{};
inline constexpr emit_single emit_single{};
inline constexpr close_span close_span{};
inline constexpr reopen_span reopen_span{};
inline constexpr continue_span continue_span{};
inline constexpr finish_span finish_span{};
inline constexpr close_and_emit_single close_and_emit_single{};
inline constexpr flush_span flush_span{};
inline constexpr finish_sequence finish_sequence{};
inline constexpr reject_transition reject_transition{};

}  // namespace spantag::reader::action
