#include <tmopt/analysis/state_propagator.hpp>
#include <tmopt/support/debug.hpp>
#include <tmopt/support/stats.hpp>

#include <algorithm>

namespace tmopt {
namespace analysis {

static const char *give_up_reason_name(give_up_reason r) {
  switch (r) {
  case GU_NONE:
    return "none";
  case GU_UNRESOLVED_BINDING:
    return "unresolved_binding";
  case GU_SIDE_EFFECT:
    return "side_effect";
  case GU_REDEFINED_BINDING:
    return "redefined_binding";
  case GU_FINAL_STATE:
    return "final_state";
  default:
    TMOPT_ERROR("unexpected give up reason ", (int)r);
  }
}

tmopt_os &operator<<(tmopt_os &o, give_up_reason r) {
  o << give_up_reason_name(r);
  return o;
}

void give_up_latch::give_up(give_up_reason r) {
  if (r == GU_NONE) {
    TMOPT_ERROR("give_up_latch::give_up called without a reason");
  }
  if (!m_given_up) {
    m_given_up = true;
    m_reason = r;
  }
}

/* state_propagator_operations */

state_propagator_operations::state_propagator_operations(
    const cfg::cfg &g, const shadows::shadow_group &initial_group,
    const shadows::shadow &initial_shadow,
    const shadows::shadow_registry &registry,
    const transition_oracle &transitions,
    const side_effect_oracle &side_effects)
    : parent_type(g), m_initial_shadow(initial_shadow),
      m_tm(initial_shadow.get_tracematch()), m_transitions(transitions),
      m_side_effects(side_effects), m_initial_stmt(nullptr),
      m_initialized_initial(false) {

  m_initial_states += m_tm.get_state_machine().initial_states();
  if (m_initial_states.is_bottom()) {
    TMOPT_WARN("tracematch ", m_tm.get_name(), " has no initial state");
  }

  const std::string &method = m_initial_shadow.get_container();
  for (auto const &s : g) {
    auto active = registry.all_active_shadows_for_host(s, method);
    if (std::find(active.begin(), active.end(), &m_initial_shadow) !=
        active.end()) {
      m_initial_stmt = &s;
      break;
    }
  }
  if (!m_initial_stmt) {
    TMOPT_ERROR("no statement of ", g.get_func_name(),
                " hosts the initial shadow ", m_initial_shadow);
  }

  m_bindings = extract_bindings(g, initial_group, m_initial_shadow);
  if (m_bindings.unresolved) {
    give_up(GU_UNRESOLVED_BINDING, nullptr);
  }

  TMOPT_LOG("state-propagator",
            tmopt::outs() << "Initial shadow " << m_initial_shadow << " at \""
                          << *m_initial_stmt << "\"\n"
                          << "Initial states " << m_initial_states << "\n"
                          << "Bindings " << m_bindings << "\n";);
}

void state_propagator_operations::give_up(give_up_reason r,
                                          const cfg::statement *s) {
  if (m_latch.is_given_up()) {
    TMOPT_LOG("state-propagator", tmopt::outs()
                                      << "Already gave up ("
                                      << m_latch.reason() << "), ignoring "
                                      << r << "\n";);
    return;
  }
  m_latch.give_up(r);
  TMOPT_COUNT_STATS("StatePropagator.gave_up");
  TMOPT_COUNT_STATS(std::string("StatePropagator.gave_up.") +
                    give_up_reason_name(r));
  TMOPT_LOG("state-propagator",
            tmopt::outs() << "Giving up (" << r << ")";
            if (s) tmopt::outs() << " at \"" << *s << "\"";
            tmopt::outs() << "\n";);
}

void state_propagator_operations::merge(const node_set_domain_t &in1,
                                        const node_set_domain_t &in2,
                                        node_set_domain_t &out) {
  out = in1 | in2;
}

void state_propagator_operations::copy(const node_set_domain_t &src,
                                       node_set_domain_t &dest) {
  dest = src;
}

void state_propagator_operations::flow_through(node_t s,
                                               node_set_domain_t &in,
                                               node_set_domain_t &out) {
  if (m_latch.is_given_up()) {
    return;
  }

  if (m_side_effects.may_trigger(*s)) {
    give_up(GU_SIDE_EFFECT, s);
    return;
  }

  if (s == m_initial_stmt && !m_initialized_initial) {
    in = m_initial_states;
    m_initialized_initial = true;
  }

  if (!in.is_bottom()) {
    for (auto const &def : s->get_live().defs()) {
      if (m_bindings.is_trace_local(def)) {
        give_up(GU_REDEFINED_BINDING, s);
        break;
      }
    }
  }

  out.clear();
  for (const automaton::sm_node *n : in) {
    node_set_domain_t succs =
        m_transitions.successors(*n, m_tm, *s, m_initial_states,
                                 m_bindings.formal_to_local,
                                 m_bindings.actual_to_local);
    for (const automaton::sm_node *succ : succs) {
      if (succ->is_final_node()) {
        give_up(GU_FINAL_STATE, s);
        return;
      }
    }
    out |= succs;
  }

  TMOPT_LOG("state-propagator", tmopt::outs() << "\"" << *s << "\": " << in
                                              << " ==> " << out << "\n";);
}

/* state_propagator */

state_propagator::state_propagator(
    const cfg::cfg &g, const shadows::shadow_group &initial_group,
    const shadows::shadow &initial_shadow,
    const shadows::shadow_registry &registry,
    const cg::abstracted_call_graph &abstracted_cg,
    const transition_oracle &transitions)
    : m_cfg(g), m_owned_side_effects(
                    new call_graph_side_effect_oracle(abstracted_cg)),
      m_ops(g, initial_group, initial_shadow, registry, transitions,
            *m_owned_side_effects),
      m_fixpo(g, m_ops) {
  run();
}

state_propagator::state_propagator(const cfg::cfg &g,
                                   const shadows::shadow_group &initial_group,
                                   const shadows::shadow &initial_shadow,
                                   const shadows::shadow_registry &registry,
                                   const side_effect_oracle &side_effects,
                                   const transition_oracle &transitions)
    : m_cfg(g), m_owned_side_effects(nullptr),
      m_ops(g, initial_group, initial_shadow, registry, transitions,
            side_effects),
      m_fixpo(g, m_ops) {
  run();
}

void state_propagator::run() {
  TMOPT_COUNT_STATS("StatePropagator.analyses");
  m_name = m_ops.name();
  TMOPT_LOG("state-propagator", tmopt::outs()
                                    << "Running " << m_name << " on "
                                    << m_cfg.get_func_name() << "\n";);
  m_fixpo.run();
  TmoptStats::count_max("StatePropagator.max_iterations",
                        m_fixpo.get_iterations());
  TMOPT_LOG("state-propagator", tmopt::outs()
                                    << m_cfg.get_func_name()
                                    << " is safely invariant: "
                                    << is_safely_invariant() << "\n";);
  TMOPT_VERBOSE_IF(1, write(tmopt::outs()););
}

bool state_propagator::is_safely_invariant() const {
  if (gave_up()) {
    return false;
  }
  for (auto tail : m_cfg.tails()) {
    const node_set_domain_t *out = m_fixpo.get_out(tail);
    if (!out) {
      continue;
    }
    for (const automaton::sm_node *n : *out) {
      if (!n->is_initial_node()) {
        return false;
      }
    }
  }
  return true;
}

const state_propagator::node_set_domain_t &
state_propagator::get_flow_before(const cfg::statement &s) const {
  const node_set_domain_t *in =
      (m_cfg.contains(s) ? m_fixpo.get_in(&s) : nullptr);
  if (!in) {
    TMOPT_ERROR("statement \"", s, "\" does not belong to ",
                m_cfg.get_func_name());
  }
  return *in;
}

const state_propagator::node_set_domain_t &
state_propagator::get_flow_after(const cfg::statement &s) const {
  const node_set_domain_t *out =
      (m_cfg.contains(s) ? m_fixpo.get_out(&s) : nullptr);
  if (!out) {
    TMOPT_ERROR("statement \"", s, "\" does not belong to ",
                m_cfg.get_func_name());
  }
  return *out;
}

void state_propagator::write(tmopt_os &o) const {
  o << m_name << " for " << m_cfg.get_func_name() << "\n";
  for (auto const &s : m_cfg) {
    o << "  " << s.index() << ": " << get_flow_before(s) << " " << s << " "
      << get_flow_after(s) << "\n";
  }
  o << "verdict: " << (is_safely_invariant() ? "safely invariant" : "unsafe");
  if (gave_up()) {
    o << " (gave up: " << get_give_up_reason() << ")";
  }
  o << "\n";
}

} // end namespace analysis
} // end namespace tmopt
