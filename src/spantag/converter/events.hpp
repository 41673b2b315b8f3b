#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "spantag/types.hpp"

namespace spantag::converter::events {

struct converting_done;
struct converting_error;

}  // namespace spantag::converter::events

namespace spantag::converter::event {

struct convert {
  std::span<const std::string> tags = {};
  scheme_kind source = scheme_kind::bio;
  scheme_kind target = scheme_kind::iobes;
  repair_policy policy = repair_policy::strict;
  std::vector<std::string> * tags_out = nullptr;
  // filled only under repair_policy::keep_going
  std::vector<repair> * repairs_out = nullptr;
  int32_t * error_out = nullptr;
  error_detail * detail_out = nullptr;
  void * owner_sm = nullptr;
  bool (*dispatch_done)(void * owner_sm, const events::converting_done &) = nullptr;
  bool (*dispatch_error)(void * owner_sm, const events::converting_error &) = nullptr;
};

}  // namespace spantag::converter::event

namespace spantag::converter::events {

struct converting_done {
  const event::convert * request = nullptr;
  int32_t span_count = 0;
  int32_t tag_count = 0;
};

struct converting_error {
  const event::convert * request = nullptr;
  int32_t err = 0;
};

}  // namespace spantag::converter::events
