#pragma once

#include <boost/sml.hpp>
#include <cstdint>

#include "spantag/parser/actions.hpp"
#include "spantag/parser/events.hpp"
#include "spantag/parser/guards.hpp"

namespace spantag::parser {

struct initialized {};
struct parse_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * Tag sequence parser.
 *
 * state purposes:
 * - `initialized`: idle state awaiting parse intent.
 * - `parse_decision`: run the token-level reader and branch on the phase
 *   result.
 * - `done`/`errored`: terminal outcomes of the last request.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_parse`/`invalid_parse` validate output pointers, scheme and
 *   policy.
 * - `phase_*` guards observe errors set by actions.
 *
 * action side effects:
 * - `run_parse` decodes, reads spans and dispatches callbacks.
 * - `reject_invalid_parse` clears outputs and reports the rejection.
 * - `on_unexpected` reports any event sequencing violations.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::parse>[guard::valid_parse{}] /
            action::run_parse = sml::state<parse_decision>,
        sml::state<initialized> + sml::event<event::parse>[guard::invalid_parse{}] /
            action::reject_invalid_parse = sml::state<errored>,

        sml::state<done> + sml::event<event::parse>[guard::valid_parse{}] /
            action::run_parse = sml::state<parse_decision>,
        sml::state<done> + sml::event<event::parse>[guard::invalid_parse{}] /
            action::reject_invalid_parse = sml::state<errored>,

        sml::state<errored> + sml::event<event::parse>[guard::valid_parse{}] /
            action::run_parse = sml::state<parse_decision>,
        sml::state<errored> + sml::event<event::parse>[guard::invalid_parse{}] /
            action::reject_invalid_parse = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::parse>[guard::valid_parse{}] /
            action::run_parse = sml::state<parse_decision>,
        sml::state<unexpected> + sml::event<event::parse>[guard::invalid_parse{}] /
            action::reject_invalid_parse = sml::state<unexpected>,

        sml::state<parse_decision>[guard::phase_ok{}] = sml::state<done>,
        sml::state<parse_decision>[guard::phase_failed{}] = sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<parse_decision> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>);
  }
};

struct sm : public boost::sml::sm<model> {
  using base_type = boost::sml::sm<model>;
  sm() : base_type(context_) {}

  sm(const sm &) = delete;
  sm & operator=(const sm &) = delete;
  sm(sm &&) = delete;
  sm & operator=(sm &&) = delete;

  using base_type::is;
  using base_type::process_event;
  using base_type::visit_current_states;

  int32_t last_error() const noexcept { return context_.last_error; }
  int32_t span_count() const noexcept { return context_.span_count; }
  int32_t repair_count() const noexcept { return context_.repair_count; }

 private:
  action::context context_{};
};

}  // namespace spantag::parser
