#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "spantag/scheme/detail.hpp"
#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"
#include "spantag/transition/table.hpp"
#include "spantag/types.hpp"

namespace spantag::transition {

inline constexpr std::string_view k_start_label = "<START>";
inline constexpr std::string_view k_end_label = "<END>";

struct entry {
  std::string_view source = {};
  std::string_view target = {};
  bool valid = false;
};

}  // namespace spantag::transition

namespace spantag::transition::detail {

/**
 * Every concrete tag over `types` (plus the outside tag) that may follow
 * `previous`. Roles the scheme lacks are never produced.
 */
inline std::vector<std::string> successors(const scheme_kind kind, const scheme::tag & previous,
                                           std::span<const std::string_view> types) {
  std::vector<std::string> out;
  if (!is_known_scheme(kind)) {
    return out;
  }
  const scheme::descriptor & desc = scheme::describe(kind);
  if (allows(kind, previous, scheme::k_outside_tag)) {
    out.push_back(scheme::detail::render_outside());
  }
  constexpr scheme::role k_typed_roles[] = {scheme::role::begin, scheme::role::inside,
                                            scheme::role::end, scheme::role::single};
  for (const std::string_view type : types) {
    if (type.empty()) {
      continue;
    }
    for (const scheme::role r : k_typed_roles) {
      if (!scheme::has_role(kind, r)) {
        continue;
      }
      const char marker = desc.role_markers[static_cast<size_t>(r)];
      const scheme::tag next{r, marker, type};
      if (allows(kind, previous, next)) {
        out.push_back(scheme::detail::render_tag(marker, type));
      }
    }
  }
  return out;
}

/**
 * Full transition matrix over a label inventory plus synthetic start and end
 * labels, row by row in `labels` order followed by start then end. Fails on
 * the first label that does not decode under `kind`.
 */
inline int32_t build_transitions(const scheme_kind kind, std::span<const std::string> labels,
                                 std::vector<entry> & out, error_detail * detail_out = nullptr) {
  out.clear();
  if (detail_out != nullptr) {
    detail_out->reset();
  }
  if (!is_known_scheme(kind)) {
    if (detail_out != nullptr) {
      detail_out->status = SPANTAG_ERR_UNKNOWN_SCHEME;
    }
    return SPANTAG_ERR_UNKNOWN_SCHEME;
  }

  std::vector<scheme::tag> decoded(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    const int32_t err = scheme::detail::decode_tag(kind, labels[i], decoded[i]);
    if (err != SPANTAG_OK) {
      if (detail_out != nullptr) {
        detail_out->status = err;
        detail_out->index = static_cast<int32_t>(i);
        detail_out->current = labels[i];
      }
      return err;
    }
  }

  const size_t count = labels.size() + 2;
  const size_t start_slot = labels.size();
  const size_t end_slot = labels.size() + 1;
  auto label_at = [&](const size_t slot) -> std::string_view {
    if (slot == start_slot) {
      return k_start_label;
    }
    if (slot == end_slot) {
      return k_end_label;
    }
    return labels[slot];
  };

  out.reserve(count * count);
  for (size_t src = 0; src < count; ++src) {
    for (size_t tgt = 0; tgt < count; ++tgt) {
      bool valid = false;
      if (tgt != start_slot && src != end_slot) {
        const scheme::tag & previous =
            src == start_slot ? scheme::k_boundary_tag : decoded[src];
        const scheme::tag & next = tgt == end_slot ? scheme::k_boundary_tag : decoded[tgt];
        valid = allows(kind, previous, next);
      }
      out.push_back(entry{label_at(src), label_at(tgt), valid});
    }
  }
  return SPANTAG_OK;
}

/**
 * Whether every transition of `tags`, bracketed by start and end, is legal.
 * Returns a decode error for the first malformed tag.
 */
inline int32_t validate_sequence(const scheme_kind kind, std::span<const std::string> tags,
                                 bool & valid_out, error_detail * detail_out = nullptr) {
  valid_out = false;
  if (detail_out != nullptr) {
    detail_out->reset();
  }
  if (!is_known_scheme(kind)) {
    if (detail_out != nullptr) {
      detail_out->status = SPANTAG_ERR_UNKNOWN_SCHEME;
    }
    return SPANTAG_ERR_UNKNOWN_SCHEME;
  }

  std::vector<scheme::tag> decoded(tags.size());
  for (size_t i = 0; i < tags.size(); ++i) {
    const int32_t err = scheme::detail::decode_tag(kind, tags[i], decoded[i]);
    if (err != SPANTAG_OK) {
      if (detail_out != nullptr) {
        detail_out->status = err;
        detail_out->index = static_cast<int32_t>(i);
        detail_out->current = tags[i];
      }
      return err;
    }
  }

  scheme::tag previous = scheme::k_boundary_tag;
  for (size_t i = 0; i <= decoded.size(); ++i) {
    const scheme::tag & next = i < decoded.size() ? decoded[i] : scheme::k_boundary_tag;
    if (!allows(kind, previous, next)) {
      if (detail_out != nullptr) {
        detail_out->status = SPANTAG_ERR_INVALID_TRANSITION;
        detail_out->index = static_cast<int32_t>(i);
        detail_out->previous = i > 0 ? std::string_view(tags[i - 1]) : std::string_view{};
        detail_out->current = i < tags.size() ? std::string_view(tags[i]) : std::string_view{};
      }
      return SPANTAG_OK;
    }
    previous = next;
  }
  valid_out = true;
  return SPANTAG_OK;
}

}  // namespace spantag::transition::detail
