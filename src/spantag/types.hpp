#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "spantag/spantag.h"

namespace spantag {

enum class scheme_kind : uint8_t {
  iob = SPANTAG_SCHEME_IOB,
  bio = SPANTAG_SCHEME_BIO,
  iobes = SPANTAG_SCHEME_IOBES,
  bilou = SPANTAG_SCHEME_BILOU,
  bmewo = SPANTAG_SCHEME_BMEWO,
};

enum class repair_policy : uint8_t {
  strict = SPANTAG_POLICY_STRICT,
  coerce = SPANTAG_POLICY_COERCE,
  keep_going = SPANTAG_POLICY_KEEP_GOING,
};

inline constexpr bool is_known_scheme(const scheme_kind kind) noexcept {
  return static_cast<uint32_t>(kind) < SPANTAG_SCHEME_COUNT;
}

inline constexpr bool is_known_policy(const repair_policy policy) noexcept {
  return policy == repair_policy::strict || policy == repair_policy::coerce ||
         policy == repair_policy::keep_going;
}

/**
 * One labeled run of tokens. `tokens` always holds `[start, end)`.
 */
struct span {
  std::string type = {};
  int32_t start = 0;
  int32_t end = 0;
  std::vector<int32_t> tokens = {};

  bool operator==(const span &) const = default;
};

inline span make_span(std::string_view type, const int32_t start, const int32_t end) {
  span out{};
  out.type = std::string(type);
  out.start = start;
  out.end = end;
  if (end > start) {
    out.tokens.reserve(static_cast<size_t>(end - start));
  }
  for (int32_t i = start; i < end; ++i) {
    out.tokens.push_back(i);
  }
  return out;
}

enum class repair_kind : uint8_t {
  // continuation marker with no open span of its type; opened a new span
  inside_as_begin = 0,
  // end marker with no open span of its type; emitted a one-token span
  end_as_single = 1,
  // open span cut off before its end marker
  unclosed_span = 2,
  // IOB begin marker not separating two spans of the same type
  unexpected_begin = 3,
};

/**
 * One coercion applied while reading tags. The views point into the
 * caller's tag storage; an empty `previous` is the start of the sequence and
 * an empty `current` is the end of it.
 */
struct repair {
  int32_t index = 0;
  repair_kind kind = repair_kind::inside_as_begin;
  std::string_view previous = {};
  std::string_view current = {};

  bool operator==(const repair &) const = default;
};

/**
 * First fatal error of a request. `index` is a token index for parsing and a
 * span index for encoding.
 */
struct error_detail {
  int32_t status = SPANTAG_OK;
  int32_t index = -1;
  std::string_view previous = {};
  std::string_view current = {};

  void reset() noexcept { *this = error_detail{}; }
};

}  // namespace spantag
