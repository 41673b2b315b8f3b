#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "spantag/reader/events.hpp"
#include "spantag/reader/sm.hpp"
#include "spantag/scheme/types.hpp"

namespace spantag::reader {

using dispatch_step_fn = bool (*)(sm & machine, int32_t index, const scheme::tag & value,
                                  std::string_view text);

template <class Event>
inline bool dispatch_step(sm & machine, const int32_t index, const scheme::tag & value,
                          const std::string_view text) {
  return machine.process_event(Event{index, value, text});
}

// Indexed by scheme::role; boundary maps to sequence_end.
inline dispatch_step_fn dispatch_for_role(const scheme::role r) {
  static constexpr dispatch_step_fn k_table[] = {
    dispatch_step<event::outside_tag>,
    dispatch_step<event::begin_tag>,
    dispatch_step<event::inside_tag>,
    dispatch_step<event::end_tag>,
    dispatch_step<event::single_tag>,
    dispatch_step<event::sequence_end>,
  };
  static_assert(sizeof(k_table) / sizeof(k_table[0]) == scheme::k_role_count,
                "reader dispatch table must cover all roles");
  const size_t index = static_cast<size_t>(r);
  if (index >= scheme::k_role_count) {
    return nullptr;
  }
  return k_table[index];
}

inline bool step(sm & machine, const int32_t index, const scheme::tag & value,
                 const std::string_view text) {
  const dispatch_step_fn fn = dispatch_for_role(value.kind);
  if (fn == nullptr) {
    return false;
  }
  return fn(machine, index, value, text);
}

inline bool finish(sm & machine, const int32_t length) {
  return dispatch_step<event::sequence_end>(machine, length, scheme::k_boundary_tag, {});
}

}  // namespace spantag::reader
