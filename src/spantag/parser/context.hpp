#pragma once

#include <cstdint>
#include <vector>

#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"

namespace spantag::parser::action {

struct context {
  std::vector<scheme::tag> decoded = {};
  int32_t span_count = 0;
  int32_t repair_count = 0;
  int32_t phase_error = SPANTAG_OK;
  int32_t last_error = SPANTAG_OK;
};

}  // namespace spantag::parser::action
