#pragma once

#include <boost/sml.hpp>

#include "spantag/reader/actions.hpp"
#include "spantag/reader/events.hpp"
#include "spantag/reader/guards.hpp"

namespace spantag::reader {

struct idle {};
struct in_span {};
struct halted {};

/**
 * Token-level span reader.
 *
 * state purposes:
 * - `idle`: no span is open.
 * - `in_span`: a span of `context::open_type` is open since
 *   `context::open_start`.
 * - `halted`: a strict read met an illegal transition; further tags are
 *   not accepted.
 *
 * guard semantics:
 * - `transition_accepted`: the transition from the previous tag is legal,
 *   or the policy repairs illegal transitions.
 * - `transition_rejected`: strict policy and an illegal transition.
 *
 * action side effects:
 * - every accepting action audits the transition first, recording a repair
 *   under `keep_going`, then opens, closes or emits spans.
 * - `reject_transition` stores the failure in the context.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        // no open span
        *sml::state<idle> + sml::event<event::outside_tag>[guard::transition_accepted{}] /
            action::skip_outside = sml::state<idle>,
        sml::state<idle> + sml::event<event::outside_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<idle> + sml::event<event::begin_tag>[guard::transition_accepted{}] /
            action::open_span = sml::state<in_span>,
        sml::state<idle> + sml::event<event::begin_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<idle> + sml::event<event::inside_tag>[guard::transition_accepted{}] /
            action::open_span = sml::state<in_span>,
        sml::state<idle> + sml::event<event::inside_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<idle> + sml::event<event::end_tag>[guard::transition_accepted{}] /
            action::emit_single = sml::state<idle>,
        sml::state<idle> + sml::event<event::end_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<idle> + sml::event<event::single_tag>[guard::transition_accepted{}] /
            action::emit_single = sml::state<idle>,
        sml::state<idle> + sml::event<event::single_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<idle> + sml::event<event::sequence_end>[guard::transition_accepted{}] /
            action::finish_sequence = sml::state<idle>,
        sml::state<idle> + sml::event<event::sequence_end>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,

        // open span
        sml::state<in_span> + sml::event<event::outside_tag>[guard::transition_accepted{}] /
            action::close_span = sml::state<idle>,
        sml::state<in_span> + sml::event<event::outside_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<in_span> + sml::event<event::begin_tag>[guard::transition_accepted{}] /
            action::reopen_span = sml::state<in_span>,
        sml::state<in_span> + sml::event<event::begin_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<in_span> + sml::event<event::inside_tag>[guard::transition_accepted{}] /
            action::continue_span = sml::state<in_span>,
        sml::state<in_span> + sml::event<event::inside_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<in_span> + sml::event<event::end_tag>[guard::transition_accepted{}] /
            action::finish_span = sml::state<idle>,
        sml::state<in_span> + sml::event<event::end_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<in_span> + sml::event<event::single_tag>[guard::transition_accepted{}] /
            action::close_and_emit_single = sml::state<idle>,
        sml::state<in_span> + sml::event<event::single_tag>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>,
        sml::state<in_span> + sml::event<event::sequence_end>[guard::transition_accepted{}] /
            action::flush_span = sml::state<idle>,
        sml::state<in_span> + sml::event<event::sequence_end>[guard::transition_rejected{}] /
            action::reject_transition = sml::state<halted>);
  }
};

struct sm : public boost::sml::sm<model> {
  using base_type = boost::sml::sm<model>;
  using base_type::base_type;
  using base_type::is;
  using base_type::process_event;
};

}  // namespace spantag::reader
