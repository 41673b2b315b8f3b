#pragma once

#include <cstdint>
#include <vector>

#include "spantag/encoder/sm.hpp"
#include "spantag/parser/sm.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::converter::action {

struct context {
  parser::sm parse_machine = {};
  encoder::sm encode_machine = {};
  // intermediate spans between the parse and encode phases
  std::vector<span> spans = {};
  int32_t span_count = 0;
  int32_t tag_count = 0;
  int32_t phase_error = SPANTAG_OK;
  int32_t last_error = SPANTAG_OK;
};

}  // namespace spantag::converter::action
