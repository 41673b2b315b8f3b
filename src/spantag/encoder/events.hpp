#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "spantag/types.hpp"

namespace spantag::encoder::events {

struct encoding_done;
struct encoding_error;

}  // namespace spantag::encoder::events

namespace spantag::encoder::event {

struct encode {
  std::span<const span> spans = {};
  // negative: the largest span end
  int32_t token_count = -1;
  scheme_kind scheme = scheme_kind::bio;
  std::vector<std::string> * tags_out = nullptr;
  int32_t * error_out = nullptr;
  error_detail * detail_out = nullptr;
  void * owner_sm = nullptr;
  bool (*dispatch_done)(void * owner_sm, const events::encoding_done &) = nullptr;
  bool (*dispatch_error)(void * owner_sm, const events::encoding_error &) = nullptr;
};

}  // namespace spantag::encoder::event

namespace spantag::encoder::events {

struct encoding_done {
  const event::encode * request = nullptr;
  int32_t tag_count = 0;
};

struct encoding_error {
  const event::encode * request = nullptr;
  int32_t err = 0;
};

}  // namespace spantag::encoder::events
