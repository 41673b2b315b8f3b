#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::reader::action {

struct context {
  scheme_kind scheme = scheme_kind::bio;
  repair_policy policy = repair_policy::strict;
  std::vector<span> * spans_out = nullptr;
  std::vector<repair> * repairs_out = nullptr;
  error_detail * detail_out = nullptr;

  scheme::tag previous = scheme::k_boundary_tag;
  std::string_view previous_text = {};
  std::string_view open_type = {};
  int32_t open_start = -1;
  int32_t repair_count = 0;
  int32_t phase_error = SPANTAG_OK;
};

}  // namespace spantag::reader::action
