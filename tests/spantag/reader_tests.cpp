#include <string>
#include <vector>

#include <boost/sml.hpp>
#include <doctest/doctest.h>

#include "spantag/machines.hpp"
#include "spantag/reader/context.hpp"
#include "spantag/reader/dispatch.hpp"
#include "spantag/reader/sm.hpp"
#include "spantag/scheme/detail.hpp"
#include "spantag/spantag.h"

namespace {

struct reader_fixture {
  std::vector<spantag::span> spans = {};
  std::vector<spantag::repair> repairs = {};
  spantag::error_detail detail = {};
  spantag::reader::action::context ctx = {};

  reader_fixture(const spantag::scheme_kind scheme, const spantag::repair_policy policy) {
    ctx.scheme = scheme;
    ctx.policy = policy;
    ctx.spans_out = &spans;
    ctx.repairs_out = &repairs;
    ctx.detail_out = &detail;
  }

  // Feeds every tag then the end of sequence; stops at the first failure.
  bool run(const std::vector<std::string> & tags) {
    spantag::Reader machine{ctx};
    for (size_t i = 0; i < tags.size(); ++i) {
      spantag::scheme::tag value{};
      if (spantag::scheme::detail::decode_tag(ctx.scheme, tags[i], value) != SPANTAG_OK) {
        return false;
      }
      if (!spantag::reader::step(machine, static_cast<int32_t>(i), value, tags[i])) {
        return false;
      }
      if (ctx.phase_error != SPANTAG_OK) {
        halted = machine.is(boost::sml::state<spantag::reader::halted>);
        return false;
      }
    }
    const bool ok = spantag::reader::finish(machine, static_cast<int32_t>(tags.size()));
    halted = machine.is(boost::sml::state<spantag::reader::halted>);
    idle = machine.is(boost::sml::state<spantag::reader::idle>);
    return ok && ctx.phase_error == SPANTAG_OK;
  }

  bool halted = false;
  bool idle = false;
};

}  // namespace

TEST_CASE("reader_dispatch_table_covers_roles") {
  for (size_t r = 0; r < spantag::scheme::k_role_count; ++r) {
    CHECK(spantag::reader::dispatch_for_role(static_cast<spantag::scheme::role>(r)) != nullptr);
  }
  CHECK(spantag::reader::dispatch_for_role(static_cast<spantag::scheme::role>(42)) == nullptr);
}

TEST_CASE("reader_bio_opens_and_closes_spans") {
  reader_fixture fx{spantag::scheme_kind::bio, spantag::repair_policy::strict};
  CHECK(fx.run({"O", "B-PER", "I-PER", "O", "B-LOC"}));
  CHECK(fx.idle);
  REQUIRE(fx.spans.size() == 2);
  CHECK(fx.spans[0] == spantag::make_span("PER", 1, 3));
  CHECK(fx.spans[1] == spantag::make_span("LOC", 4, 5));
  CHECK(fx.ctx.repair_count == 0);
}

TEST_CASE("reader_strict_halts_on_illegal_transition") {
  reader_fixture fx{spantag::scheme_kind::bio, spantag::repair_policy::strict};
  CHECK_FALSE(fx.run({"B-PER", "I-LOC"}));
  CHECK(fx.halted);
  CHECK(fx.ctx.phase_error == SPANTAG_ERR_INVALID_TRANSITION);
  CHECK(fx.detail.index == 1);
  CHECK(fx.detail.previous == "B-PER");
  CHECK(fx.detail.current == "I-LOC");
}

TEST_CASE("reader_halted_refuses_further_tags") {
  reader_fixture fx{spantag::scheme_kind::bio, spantag::repair_policy::strict};
  spantag::reader::sm machine{fx.ctx};
  spantag::scheme::tag value{};
  REQUIRE(spantag::scheme::detail::decode_tag(fx.ctx.scheme, "I-PER", value) == SPANTAG_OK);
  CHECK(spantag::reader::step(machine, 0, value, "I-PER"));
  CHECK(machine.is(boost::sml::state<spantag::reader::halted>));
  CHECK_FALSE(spantag::reader::finish(machine, 1));
}

TEST_CASE("reader_coerce_counts_without_recording") {
  reader_fixture fx{spantag::scheme_kind::bio, spantag::repair_policy::coerce};
  CHECK(fx.run({"O", "I-PER", "I-LOC"}));
  REQUIRE(fx.spans.size() == 2);
  CHECK(fx.spans[0] == spantag::make_span("PER", 1, 2));
  CHECK(fx.spans[1] == spantag::make_span("LOC", 2, 3));
  CHECK(fx.ctx.repair_count == 2);
  CHECK(fx.repairs.empty());
}

TEST_CASE("reader_keep_going_records_inside_as_begin") {
  reader_fixture fx{spantag::scheme_kind::bio, spantag::repair_policy::keep_going};
  CHECK(fx.run({"O", "I-PER", "I-LOC"}));
  REQUIRE(fx.repairs.size() == 2);
  CHECK(fx.repairs[0] ==
        spantag::repair{1, spantag::repair_kind::inside_as_begin, "O", "I-PER"});
  CHECK(fx.repairs[1] ==
        spantag::repair{2, spantag::repair_kind::inside_as_begin, "I-PER", "I-LOC"});
}

TEST_CASE("reader_iob_unexpected_begin") {
  reader_fixture fx{spantag::scheme_kind::iob, spantag::repair_policy::keep_going};
  CHECK(fx.run({"O", "B-PER", "I-PER"}));
  REQUIRE(fx.spans.size() == 1);
  CHECK(fx.spans[0] == spantag::make_span("PER", 1, 3));
  REQUIRE(fx.repairs.size() == 1);
  CHECK(fx.repairs[0].kind == spantag::repair_kind::unexpected_begin);
  CHECK(fx.repairs[0].index == 1);
}

TEST_CASE("reader_iob_separator_splits_same_type") {
  reader_fixture fx{spantag::scheme_kind::iob, spantag::repair_policy::strict};
  CHECK(fx.run({"I-PER", "I-PER", "B-PER", "I-LOC"}));
  REQUIRE(fx.spans.size() == 3);
  CHECK(fx.spans[0] == spantag::make_span("PER", 0, 2));
  CHECK(fx.spans[1] == spantag::make_span("PER", 2, 3));
  CHECK(fx.spans[2] == spantag::make_span("LOC", 3, 4));
}

TEST_CASE("reader_iobes_end_closes_span") {
  reader_fixture fx{spantag::scheme_kind::iobes, spantag::repair_policy::strict};
  CHECK(fx.run({"B-PER", "I-PER", "E-PER", "S-LOC", "O"}));
  REQUIRE(fx.spans.size() == 2);
  CHECK(fx.spans[0] == spantag::make_span("PER", 0, 3));
  CHECK(fx.spans[1] == spantag::make_span("LOC", 3, 4));
}

TEST_CASE("reader_iobes_mismatched_end_becomes_single") {
  reader_fixture fx{spantag::scheme_kind::iobes, spantag::repair_policy::keep_going};
  CHECK(fx.run({"B-PER", "E-LOC"}));
  REQUIRE(fx.spans.size() == 2);
  CHECK(fx.spans[0] == spantag::make_span("PER", 0, 1));
  CHECK(fx.spans[1] == spantag::make_span("LOC", 1, 2));
  REQUIRE(fx.repairs.size() == 1);
  CHECK(fx.repairs[0] ==
        spantag::repair{1, spantag::repair_kind::end_as_single, "B-PER", "E-LOC"});
}

TEST_CASE("reader_iobes_outside_cuts_open_span") {
  reader_fixture fx{spantag::scheme_kind::iobes, spantag::repair_policy::keep_going};
  CHECK(fx.run({"B-PER", "O", "E-PER"}));
  REQUIRE(fx.spans.size() == 2);
  CHECK(fx.spans[0] == spantag::make_span("PER", 0, 1));
  CHECK(fx.spans[1] == spantag::make_span("PER", 2, 3));
  REQUIRE(fx.repairs.size() == 2);
  CHECK(fx.repairs[0] == spantag::repair{1, spantag::repair_kind::unclosed_span, "B-PER", "O"});
  CHECK(fx.repairs[1] == spantag::repair{2, spantag::repair_kind::end_as_single, "O", "E-PER"});
}

TEST_CASE("reader_bilou_unclosed_at_end") {
  reader_fixture fx{spantag::scheme_kind::bilou, spantag::repair_policy::keep_going};
  CHECK(fx.run({"B-PER", "I-PER"}));
  REQUIRE(fx.spans.size() == 1);
  CHECK(fx.spans[0] == spantag::make_span("PER", 0, 2));
  REQUIRE(fx.repairs.size() == 1);
  CHECK(fx.repairs[0] == spantag::repair{2, spantag::repair_kind::unclosed_span, "I-PER", ""});
}

TEST_CASE("reader_bmewo_strict_unclosed_at_end") {
  reader_fixture fx{spantag::scheme_kind::bmewo, spantag::repair_policy::strict};
  CHECK_FALSE(fx.run({"O", "B-PER", "M-PER"}));
  CHECK(fx.halted);
  CHECK(fx.detail.status == SPANTAG_ERR_INVALID_TRANSITION);
  CHECK(fx.detail.index == 3);
  CHECK(fx.detail.previous == "M-PER");
  CHECK(fx.detail.current.empty());
}
