#pragma once

#include <boost/sml.hpp>
#include <cstdint>

#include "spantag/encoder/actions.hpp"
#include "spantag/encoder/events.hpp"
#include "spantag/encoder/guards.hpp"

namespace spantag::encoder {

struct initialized {};
struct encode_decision {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * Span to tag sequence encoder.
 *
 * state purposes:
 * - `initialized`: idle state awaiting encode intent.
 * - `encode_decision`: render tags and branch on the phase result.
 * - `done`/`errored`: terminal outcomes of the last request.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_encode`/`invalid_encode` validate output pointers and scheme.
 * - `phase_*` guards observe errors set by actions.
 *
 * action side effects:
 * - `run_encode` validates spans, renders tags and dispatches callbacks.
 * - `reject_invalid_encode` clears outputs and reports the rejection.
 * - `on_unexpected` reports sequencing violations.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::encode>[guard::valid_encode{}] /
            action::run_encode = sml::state<encode_decision>,
        sml::state<initialized> + sml::event<event::encode>[guard::invalid_encode{}] /
            action::reject_invalid_encode = sml::state<errored>,

        sml::state<done> + sml::event<event::encode>[guard::valid_encode{}] /
            action::run_encode = sml::state<encode_decision>,
        sml::state<done> + sml::event<event::encode>[guard::invalid_encode{}] /
            action::reject_invalid_encode = sml::state<errored>,

        sml::state<errored> + sml::event<event::encode>[guard::valid_encode{}] /
            action::run_encode = sml::state<encode_decision>,
        sml::state<errored> + sml::event<event::encode>[guard::invalid_encode{}] /
            action::reject_invalid_encode = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::encode>[guard::valid_encode{}] /
            action::run_encode = sml::state<encode_decision>,
        sml::state<unexpected> + sml::event<event::encode>[guard::invalid_encode{}] /
            action::reject_invalid_encode = sml::state<unexpected>,

        sml::state<encode_decision>[guard::phase_ok{}] = sml::state<done>,
        sml::state<encode_decision>[guard::phase_failed{}] = sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
            sml::state<unexpected>,
        sml::state<encode_decision> + sml::unexpected_event<sml::_> / action::on_unexpected =
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
  int32_t tag_count() const noexcept { return context_.tag_count; }

 private:
  action::context context_{};
};

}  // namespace spantag::encoder
