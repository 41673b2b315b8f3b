#pragma once

#include <cstdint>
#include <vector>

#include "spantag/spantag.h"

namespace spantag::encoder::action {

struct context {
  // span indices ordered by start
  std::vector<int32_t> order = {};
  int32_t tag_count = 0;
  int32_t phase_error = SPANTAG_OK;
  int32_t last_error = SPANTAG_OK;
};

}  // namespace spantag::encoder::action
