#include <string_view>

#include <doctest/doctest.h>

#include "spantag/scheme/detail.hpp"
#include "spantag/scheme/types.hpp"
#include "spantag/spantag.h"

namespace {

spantag::scheme::tag decoded(const spantag::scheme_kind kind, const std::string_view text,
                             int32_t & err) {
  spantag::scheme::tag out{};
  err = spantag::scheme::detail::decode_tag(kind, text, out);
  return out;
}

}  // namespace

TEST_CASE("scheme_decode_outside_tag") {
  for (const auto kind : spantag::scheme::k_all_schemes) {
    int32_t err = -1;
    const auto tag = decoded(kind, "O", err);
    CHECK(err == SPANTAG_OK);
    CHECK(tag.kind == spantag::scheme::role::outside);
    CHECK(tag.type.empty());
  }
}

TEST_CASE("scheme_decode_typed_tags") {
  int32_t err = -1;
  auto tag = decoded(spantag::scheme_kind::bio, "B-PER", err);
  CHECK(err == SPANTAG_OK);
  CHECK(tag.kind == spantag::scheme::role::begin);
  CHECK(tag.marker == 'B');
  CHECK(tag.type == "PER");

  tag = decoded(spantag::scheme_kind::bmewo, "M-LOC", err);
  CHECK(err == SPANTAG_OK);
  CHECK(tag.kind == spantag::scheme::role::inside);

  tag = decoded(spantag::scheme_kind::bilou, "U-ORG", err);
  CHECK(err == SPANTAG_OK);
  CHECK(tag.kind == spantag::scheme::role::single);

  tag = decoded(spantag::scheme_kind::iobes, "E-MISC", err);
  CHECK(err == SPANTAG_OK);
  CHECK(tag.kind == spantag::scheme::role::end);
}

TEST_CASE("scheme_decode_keeps_type_after_first_separator") {
  int32_t err = -1;
  const auto tag = decoded(spantag::scheme_kind::bio, "I-date-time", err);
  CHECK(err == SPANTAG_OK);
  CHECK(tag.type == "date-time");
}

TEST_CASE("scheme_decode_rejects_malformed_tags") {
  int32_t err = SPANTAG_OK;
  decoded(spantag::scheme_kind::bio, "X-PER", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
  decoded(spantag::scheme_kind::bio, "B-", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
  decoded(spantag::scheme_kind::bio, "BPER", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
  decoded(spantag::scheme_kind::bio, "O-PER", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
  decoded(spantag::scheme_kind::bio, "", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
  decoded(spantag::scheme_kind::iob, "E-PER", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
  decoded(spantag::scheme_kind::bilou, "E-PER", err);
  CHECK(err == SPANTAG_ERR_MALFORMED_TAG);
}

TEST_CASE("scheme_decode_rejects_unknown_kind") {
  int32_t err = SPANTAG_OK;
  decoded(static_cast<spantag::scheme_kind>(9), "O", err);
  CHECK(err == SPANTAG_ERR_UNKNOWN_SCHEME);
}

TEST_CASE("scheme_render_by_position") {
  using spantag::scheme::position;
  using spantag::scheme::detail::render_tag;
  CHECK(render_tag(spantag::scheme_kind::iob, position::first, "PER") == "I-PER");
  CHECK(render_tag(spantag::scheme_kind::bio, position::only, "PER") == "B-PER");
  CHECK(render_tag(spantag::scheme_kind::iobes, position::last, "PER") == "E-PER");
  CHECK(render_tag(spantag::scheme_kind::bilou, position::only, "PER") == "U-PER");
  CHECK(render_tag(spantag::scheme_kind::bmewo, position::middle, "PER") == "M-PER");
  CHECK(spantag::scheme::detail::render_outside() == "O");
}

TEST_CASE("scheme_position_in_span") {
  using spantag::scheme::position;
  using spantag::scheme::detail::position_in_span;
  CHECK(position_in_span(4, 4, 5) == position::only);
  CHECK(position_in_span(1, 1, 4) == position::first);
  CHECK(position_in_span(2, 1, 4) == position::middle);
  CHECK(position_in_span(3, 1, 4) == position::last);
}

TEST_CASE("scheme_from_name_accepts_aliases") {
  spantag::scheme_kind kind = spantag::scheme_kind::iob;
  CHECK(spantag::scheme::detail::scheme_from_name("IOB2", kind) == SPANTAG_OK);
  CHECK(kind == spantag::scheme_kind::bio);
  CHECK(spantag::scheme::detail::scheme_from_name(" iob1 ", kind) == SPANTAG_OK);
  CHECK(kind == spantag::scheme_kind::iob);
  CHECK(spantag::scheme::detail::scheme_from_name("BMEOW", kind) == SPANTAG_OK);
  CHECK(kind == spantag::scheme_kind::bmewo);
  CHECK(spantag::scheme::detail::scheme_from_name("Bilou", kind) == SPANTAG_OK);
  CHECK(kind == spantag::scheme_kind::bilou);
  CHECK(spantag::scheme::detail::scheme_from_name("iobes", kind) == SPANTAG_OK);
  CHECK(kind == spantag::scheme_kind::iobes);
}

TEST_CASE("scheme_from_name_rejects_unknown") {
  spantag::scheme_kind kind = spantag::scheme_kind::iobes;
  CHECK(spantag::scheme::detail::scheme_from_name("bioul", kind) == SPANTAG_ERR_UNKNOWN_SCHEME);
  CHECK(spantag::scheme::detail::scheme_from_name("", kind) == SPANTAG_ERR_UNKNOWN_SCHEME);
  CHECK(kind == spantag::scheme_kind::iobes);
}

TEST_CASE("scheme_name_round_trips") {
  for (const auto kind : spantag::scheme::k_all_schemes) {
    spantag::scheme_kind parsed = spantag::scheme_kind::iob;
    const auto name = spantag::scheme::detail::scheme_name(kind);
    REQUIRE_FALSE(name.empty());
    CHECK(spantag::scheme::detail::scheme_from_name(name, parsed) == SPANTAG_OK);
    CHECK(parsed == kind);
  }
  CHECK(spantag::scheme::detail::scheme_name(static_cast<spantag::scheme_kind>(7)).empty());
}

TEST_CASE("scheme_policy_from_name") {
  spantag::repair_policy policy = spantag::repair_policy::strict;
  CHECK(spantag::scheme::detail::policy_from_name("Keep-Going", policy) == SPANTAG_OK);
  CHECK(policy == spantag::repair_policy::keep_going);
  CHECK(spantag::scheme::detail::policy_from_name("keep_going", policy) == SPANTAG_OK);
  CHECK(policy == spantag::repair_policy::keep_going);
  CHECK(spantag::scheme::detail::policy_from_name("coerce", policy) == SPANTAG_OK);
  CHECK(policy == spantag::repair_policy::coerce);
  CHECK(spantag::scheme::detail::policy_from_name("lenient", policy) ==
        SPANTAG_ERR_INVALID_ARGUMENT);
  CHECK(policy == spantag::repair_policy::coerce);
}

TEST_CASE("scheme_roles_per_descriptor") {
  using spantag::scheme::has_role;
  using spantag::scheme::role;
  CHECK_FALSE(has_role(spantag::scheme_kind::bio, role::end));
  CHECK_FALSE(has_role(spantag::scheme_kind::iob, role::single));
  CHECK(has_role(spantag::scheme_kind::iobes, role::single));
  CHECK(has_role(spantag::scheme_kind::bmewo, role::end));
  CHECK_FALSE(has_role(spantag::scheme_kind::bmewo, role::boundary));
}
