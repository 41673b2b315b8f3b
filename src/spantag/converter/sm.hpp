#pragma once

#include <boost/sml.hpp>
#include <cstdint>

#include "spantag/converter/actions.hpp"
#include "spantag/converter/events.hpp"
#include "spantag/converter/guards.hpp"

namespace spantag::converter {

struct initialized {};
struct convert_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * Re-encodes a tag sequence from one scheme into another by running an owned
 * parser and encoder back to back.
 *
 * state purposes:
 * - `initialized`: idle state awaiting convert intent.
 * - `convert_decision`: branch on the combined phase result.
 * - `done`/`errored`: terminal outcomes of the last request.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_convert`/`invalid_convert` validate output pointers, both schemes
 *   and the policy.
 * - `phase_*` guards observe errors set by actions.
 *
 * action side effects:
 * - `run_convert` parses, encodes with the input length and dispatches
 *   callbacks.
 * - `reject_invalid_convert` clears outputs and reports the rejection.
 * - `on_unexpected` reports sequencing violations.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::convert>[guard::valid_convert{}] /
            action::run_convert = sml::state<convert_decision>,
        sml::state<initialized> + sml::event<event::convert>[guard::invalid_convert{}] /
            action::reject_invalid_convert = sml::state<errored>,

        sml::state<done> + sml::event<event::convert>[guard::valid_convert{}] /
            action::run_convert = sml::state<convert_decision>,
        sml::state<done> + sml::event<event::convert>[guard::invalid_convert{}] /
            action::reject_invalid_convert = sml::state<errored>,

        sml::state<errored> + sml::event<event::convert>[guard::valid_convert{}] /
            action::run_convert = sml::state<convert_decision>,
        sml::state<errored> + sml::event<event::convert>[guard::invalid_convert{}] /
            action::reject_invalid_convert = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::convert>[guard::valid_convert{}] /
            action::run_convert = sml::state<convert_decision>,
        sml::state<unexpected> + sml::event<event::convert>[guard::invalid_convert{}] /
            action::reject_invalid_convert = sml::state<unexpected>,

        sml::state<convert_decision>[guard::phase_ok{}] = sml::state<done>,
        sml::state<convert_decision>[guard::phase_failed{}] = sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<convert_decision> + sml::unexpected_event<sml::_> / action::on_unexpected =
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
  int32_t tag_count() const noexcept { return context_.tag_count; }

 private:
  action::context context_{};
};

}  // namespace spantag::converter
