#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::scheme::detail {

inline role role_of_marker(const descriptor & desc, const char marker) noexcept {
  for (size_t i = 0; i < k_role_count; ++i) {
    if (desc.role_markers[i] != '\0' && desc.role_markers[i] == marker) {
      return static_cast<role>(i);
    }
  }
  return role::boundary;
}

/**
 * Decodes one raw tag. Accepts the bare outside marker or
 * `<marker>-<type>` with a non-outside marker of the scheme and a non-empty
 * type; everything after the first separator is the type.
 */
inline int32_t decode_tag(const scheme_kind kind, const std::string_view text, tag & out) noexcept {
  out = tag{};
  if (!is_known_scheme(kind)) {
    return SPANTAG_ERR_UNKNOWN_SCHEME;
  }
  if (text.size() == 1 && text[0] == SPANTAG_OUTSIDE_MARKER) {
    out = k_outside_tag;
    return SPANTAG_OK;
  }
  if (text.size() < 3 || text[1] != SPANTAG_TAG_SEPARATOR) {
    return SPANTAG_ERR_MALFORMED_TAG;
  }
  const role r = role_of_marker(describe(kind), text[0]);
  if (r == role::boundary || r == role::outside) {
    return SPANTAG_ERR_MALFORMED_TAG;
  }
  out.kind = r;
  out.marker = text[0];
  out.type = text.substr(2);
  return SPANTAG_OK;
}

inline char marker_for(const scheme_kind kind, const position pos) noexcept {
  return describe(kind).position_markers[static_cast<size_t>(pos)];
}

inline std::string render_tag(const char marker, const std::string_view type) {
  std::string out;
  out.reserve(type.size() + 2);
  out.push_back(marker);
  out.push_back(SPANTAG_TAG_SEPARATOR);
  out.append(type);
  return out;
}

inline std::string render_tag(const scheme_kind kind, const position pos,
                              const std::string_view type) {
  return render_tag(marker_for(kind, pos), type);
}

inline std::string render_outside() { return std::string(1, SPANTAG_OUTSIDE_MARKER); }

inline position position_in_span(const int32_t token, const int32_t start,
                                 const int32_t end) noexcept {
  if (end - start == 1) {
    return position::only;
  }
  if (token == start) {
    return position::first;
  }
  if (token == end - 1) {
    return position::last;
  }
  return position::middle;
}

inline std::string normalize_name(const std::string_view name) {
  size_t first = 0;
  size_t last = name.size();
  while (first < last && std::isspace(static_cast<unsigned char>(name[first])) != 0) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(name[last - 1])) != 0) {
    --last;
  }
  std::string out;
  out.reserve(last - first);
  for (size_t i = first; i < last; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
  }
  return out;
}

inline int32_t scheme_from_name(const std::string_view name, scheme_kind & out) {
  const std::string key = normalize_name(name);
  if (key == "iob" || key == "iob1") {
    out = scheme_kind::iob;
  } else if (key == "bio" || key == "iob2") {
    out = scheme_kind::bio;
  } else if (key == "iobes") {
    out = scheme_kind::iobes;
  } else if (key == "bilou") {
    out = scheme_kind::bilou;
  } else if (key == "bmewo" || key == "bmeow") {
    out = scheme_kind::bmewo;
  } else {
    return SPANTAG_ERR_UNKNOWN_SCHEME;
  }
  return SPANTAG_OK;
}

inline int32_t policy_from_name(const std::string_view name, repair_policy & out) {
  const std::string key = normalize_name(name);
  if (key == "strict") {
    out = repair_policy::strict;
  } else if (key == "coerce") {
    out = repair_policy::coerce;
  } else if (key == "keep-going" || key == "keep_going") {
    out = repair_policy::keep_going;
  } else {
    return SPANTAG_ERR_INVALID_ARGUMENT;
  }
  return SPANTAG_OK;
}

inline std::string_view scheme_name(const scheme_kind kind) noexcept {
  if (!is_known_scheme(kind)) {
    return {};
  }
  return describe(kind).name;
}

}  // namespace spantag::scheme::detail
