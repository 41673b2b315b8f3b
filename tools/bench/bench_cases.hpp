#pragma once

#include "bench_common.hpp"

#include <vector>

namespace spantag::bench {

// Each returns false when its input tags could not be built.
bool append_parser_cases(std::vector<result> & results, const config & cfg);
bool append_encoder_cases(std::vector<result> & results, const config & cfg);
bool append_converter_cases(std::vector<result> & results, const config & cfg);

}  // namespace spantag::bench
