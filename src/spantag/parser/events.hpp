#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "spantag/types.hpp"

namespace spantag::parser::events {

struct parsing_done;
struct parsing_error;

}  // namespace spantag::parser::events

namespace spantag::parser::event {

struct parse {
  std::span<const std::string> tags = {};
  scheme_kind scheme = scheme_kind::bio;
  repair_policy policy = repair_policy::strict;
  std::vector<span> * spans_out = nullptr;
  // filled only under repair_policy::keep_going
  std::vector<repair> * repairs_out = nullptr;
  int32_t * error_out = nullptr;
  error_detail * detail_out = nullptr;
  void * owner_sm = nullptr;
  bool (*dispatch_done)(void * owner_sm, const events::parsing_done &) = nullptr;
  bool (*dispatch_error)(void * owner_sm, const events::parsing_error &) = nullptr;
};

}  // namespace spantag::parser::event

namespace spantag::parser::events {

struct parsing_done {
  const event::parse * request = nullptr;
  int32_t span_count = 0;
  int32_t repair_count = 0;
};

struct parsing_error {
  const event::parse * request = nullptr;
  int32_t err = 0;
};

}  // namespace spantag::parser::events
