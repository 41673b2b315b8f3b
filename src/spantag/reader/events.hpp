#pragma once

#include <cstdint>
#include <string_view>

#include "spantag/scheme/types.hpp"

namespace spantag::reader::event {

// One event per tag role. `text` is the raw tag the value was decoded from.
struct outside_tag {
  int32_t index = 0;
  scheme::tag value = scheme::k_outside_tag;
  std::string_view text = {};
};

struct begin_tag {
  int32_t index = 0;
  scheme::tag value = {};
  std::string_view text = {};
};

struct inside_tag {
  int32_t index = 0;
  scheme::tag value = {};
  std::string_view text = {};
};

struct end_tag {
  int32_t index = 0;
  scheme::tag value = {};
  std::string_view text = {};
};

struct single_tag {
  int32_t index = 0;
  scheme::tag value = {};
  std::string_view text = {};
};

// Sent once after the last tag; `index` is the sequence length.
struct sequence_end {
  int32_t index = 0;
  scheme::tag value = scheme::k_boundary_tag;
  std::string_view text = {};
};

}  // namespace spantag::reader::event
