#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::scheme {

/**
 * Structural role of a marker. `boundary` never comes from a tag string; it
 * stands for the start of a sequence as a predecessor and for the end of a
 * sequence as a successor.
 */
enum class role : uint8_t {
  outside = 0,
  begin = 1,
  inside = 2,
  end = 3,
  single = 4,
  boundary = 5,
};

constexpr size_t k_role_count = 6;

enum class position : uint8_t {
  first = 0,
  middle = 1,
  last = 2,
  only = 3,
};

struct tag {
  role kind = role::boundary;
  char marker = '\0';
  std::string_view type = {};

  bool operator==(const tag &) const = default;
};

inline constexpr tag k_boundary_tag{};
inline constexpr tag k_outside_tag{role::outside, SPANTAG_OUTSIDE_MARKER, {}};

/**
 * Encoding scheme descriptor.
 *
 * decoding: `role_markers[r]` is the marker spelling role `r` ('\0' when the
 * scheme has no marker for it).
 * rendering: `position_markers[p]` is the marker written for a span token at
 * position `p`.
 * `explicit_boundary` schemes close spans with an end or single marker;
 * the others infer a span's end from the next tag.
 * `separator` is the IOB marker written on the first token of a span that
 * directly follows a span of the same type.
 */
struct descriptor {
  scheme_kind kind = scheme_kind::bio;
  std::string_view name = {};
  std::array<char, k_role_count> role_markers = {};
  std::array<char, 4> position_markers = {};
  bool explicit_boundary = false;
  char separator = '\0';
};

inline constexpr std::array<descriptor, SPANTAG_SCHEME_COUNT> k_descriptors = {{
    {scheme_kind::iob, "iob", {'O', 'B', 'I', '\0', '\0', '\0'}, {'I', 'I', 'I', 'I'}, false, 'B'},
    {scheme_kind::bio, "bio", {'O', 'B', 'I', '\0', '\0', '\0'}, {'B', 'I', 'I', 'B'}, false, '\0'},
    {scheme_kind::iobes, "iobes", {'O', 'B', 'I', 'E', 'S', '\0'}, {'B', 'I', 'E', 'S'}, true, '\0'},
    {scheme_kind::bilou, "bilou", {'O', 'B', 'I', 'L', 'U', '\0'}, {'B', 'I', 'L', 'U'}, true, '\0'},
    {scheme_kind::bmewo, "bmewo", {'O', 'B', 'M', 'E', 'W', '\0'}, {'B', 'M', 'E', 'W'}, true, '\0'},
}};

static_assert(k_descriptors[SPANTAG_SCHEME_IOB].kind == scheme_kind::iob);
static_assert(k_descriptors[SPANTAG_SCHEME_BIO].kind == scheme_kind::bio);
static_assert(k_descriptors[SPANTAG_SCHEME_IOBES].kind == scheme_kind::iobes);
static_assert(k_descriptors[SPANTAG_SCHEME_BILOU].kind == scheme_kind::bilou);
static_assert(k_descriptors[SPANTAG_SCHEME_BMEWO].kind == scheme_kind::bmewo);

inline constexpr const descriptor & describe(const scheme_kind kind) noexcept {
  return k_descriptors[static_cast<size_t>(kind)];
}

inline constexpr bool has_role(const scheme_kind kind, const role r) noexcept {
  return r != role::boundary && describe(kind).role_markers[static_cast<size_t>(r)] != '\0';
}

inline constexpr std::array<scheme_kind, SPANTAG_SCHEME_COUNT> k_all_schemes = {
    scheme_kind::iob, scheme_kind::bio, scheme_kind::iobes, scheme_kind::bilou,
    scheme_kind::bmewo,
};

}  // namespace spantag::scheme
