#pragma once

#include "spantag/converter/sm.hpp"
#include "spantag/encoder/sm.hpp"
#include "spantag/parser/sm.hpp"
#include "spantag/reader/sm.hpp"

namespace spantag {

using Converter = spantag::converter::sm;
using Encoder = spantag::encoder::sm;
using Parser = spantag::parser::sm;
using Reader = spantag::reader::sm;

}  // namespace spantag
