#pragma once

#include <array>
#include <cstddef>

#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"
#include "spantag/types.hpp"

namespace spantag::transition {

/**
 * Legal (previous, next) role pairs of one scheme.
 *
 * indexing: `allowed[previous][next][same_type]`. `role::boundary` as
 * previous is the start of a sequence; as next it is the end of a sequence.
 * `same_type` only matters where both tags carry a type.
 */
struct table {
  using same_type_row = std::array<bool, 2>;
  using next_row = std::array<same_type_row, scheme::k_role_count>;

  std::array<next_row, scheme::k_role_count> allowed = {};

  constexpr bool at(const scheme::role previous, const scheme::role next,
                    const bool same_type) const noexcept {
    return allowed[static_cast<size_t>(previous)][static_cast<size_t>(next)][same_type ? 1 : 0];
  }
};

namespace detail {

constexpr bool present(const scheme::descriptor & desc, const scheme::role r) noexcept {
  return r == scheme::role::boundary ||
         desc.role_markers[static_cast<size_t>(r)] != '\0';
}

constexpr bool lookahead_rule(const scheme::descriptor & desc, const scheme::role previous,
                              const scheme::role next, const bool same_type) noexcept {
  using scheme::role;
  // IOB needs a same-type predecessor before `B`, BIO before `I`.
  const role guarded = desc.separator != '\0' ? role::begin : role::inside;
  if (next != guarded) {
    return true;
  }
  if (previous == role::begin || previous == role::inside) {
    return same_type;
  }
  return false;
}

constexpr bool explicit_rule(const scheme::role previous, const scheme::role next,
                             const bool same_type) noexcept {
  using scheme::role;
  const bool continues = next == role::inside || next == role::end;
  if (previous == role::begin || previous == role::inside) {
    return continues && same_type;
  }
  return !continues;
}

constexpr bool rule(const scheme::descriptor & desc, const scheme::role previous,
                    const scheme::role next, const bool same_type) noexcept {
  using scheme::role;
  if (!present(desc, previous) || !present(desc, next)) {
    return false;
  }
  if (previous == role::boundary && next == role::boundary) {
    return true;
  }
  // start of sequence behaves as an outside predecessor
  const role prev = previous == role::boundary ? role::outside : previous;
  if (desc.explicit_boundary) {
    return explicit_rule(prev, next, same_type);
  }
  return lookahead_rule(desc, prev, next, same_type);
}

constexpr table make_table(const scheme::descriptor & desc) noexcept {
  table out{};
  for (size_t p = 0; p < scheme::k_role_count; ++p) {
    for (size_t n = 0; n < scheme::k_role_count; ++n) {
      for (size_t s = 0; s < 2; ++s) {
        out.allowed[p][n][s] =
            rule(desc, static_cast<scheme::role>(p), static_cast<scheme::role>(n), s == 1);
      }
    }
  }
  return out;
}

}  // namespace detail

inline constexpr std::array<table, SPANTAG_SCHEME_COUNT> k_tables = {
    detail::make_table(scheme::k_descriptors[SPANTAG_SCHEME_IOB]),
    detail::make_table(scheme::k_descriptors[SPANTAG_SCHEME_BIO]),
    detail::make_table(scheme::k_descriptors[SPANTAG_SCHEME_IOBES]),
    detail::make_table(scheme::k_descriptors[SPANTAG_SCHEME_BILOU]),
    detail::make_table(scheme::k_descriptors[SPANTAG_SCHEME_BMEWO]),
};

inline constexpr const table & table_for(const scheme_kind kind) noexcept {
  return k_tables[static_cast<size_t>(kind)];
}

/**
 * Whether `next` may directly follow `previous`. Pass `scheme::k_boundary_tag`
 * as `previous` for the first token and as `next` after the last one.
 */
inline constexpr bool allows(const scheme_kind kind, const scheme::tag & previous,
                             const scheme::tag & next) noexcept {
  if (!is_known_scheme(kind)) {
    return false;
  }
  const bool same_type = !previous.type.empty() && previous.type == next.type;
  return table_for(kind).at(previous.kind, next.kind, same_type);
}

static_assert(!table_for(scheme_kind::bio).at(scheme::role::boundary, scheme::role::inside, false));
static_assert(table_for(scheme_kind::bio).at(scheme::role::begin, scheme::role::inside, true));
static_assert(!table_for(scheme_kind::iob).at(scheme::role::outside, scheme::role::begin, false));
static_assert(!table_for(scheme_kind::iobes).at(scheme::role::inside, scheme::role::boundary, true));
static_assert(table_for(scheme_kind::bilou).at(scheme::role::single, scheme::role::boundary, false));

}  // namespace spantag::transition
