#pragma once

/**
 * State propagation analysis.
 *
 * Forward may-analysis that computes, for each statement of a
 * procedure, the set of automaton nodes of a tracematch that can be
 * active there, assuming the automaton is in an initial configuration
 * when the initial shadow is reached. The procedure is "safely
 * invariant" if it never drives the automaton into a final node and
 * the automaton is back in an initial node at every exit. In that
 * case the runtime does not need to track the automaton through the
 * procedure.
 *
 * The analysis gives up, and the verdict is false, as soon as it
 * cannot trust its own reasoning:
 *
 *   - a bound advice local is not assigned from a plain local,
 *   - a statement may trigger events elsewhere in the program,
 *   - a trace local is redefined after the initial shadow,
 *   - a transition reaches a final node.
 *
 * The analysis assumes that everything involved is thread-local. It
 * does not check that a skip loop refers to the same object as the
 * initial shadow, e.g.:
 *
 *   i = c.iterator();
 *   i2 = c.iterator();
 *   if (i.hasNext()) {
 *     i.next();
 *     if (i2.hasNext()) {  // back to the initial node, which is wrong
 *       i.next();
 *     }
 *   }
 **/

#include <tmopt/analysis/bindings.hpp>
#include <tmopt/analysis/oracles.hpp>
#include <tmopt/automaton/tracematch.hpp>
#include <tmopt/cfg/cfg.hpp>
#include <tmopt/cg/call_graph.hpp>
#include <tmopt/domains/node_set_domain.hpp>
#include <tmopt/fixpoint/fwd_fixpoint_iterator.hpp>
#include <tmopt/shadows/shadow.hpp>
#include <tmopt/support/os.hpp>

#include <memory>
#include <string>

namespace tmopt {
namespace analysis {

enum give_up_reason {
  GU_NONE = 0,
  GU_UNRESOLVED_BINDING,
  GU_SIDE_EFFECT,
  GU_REDEFINED_BINDING,
  GU_FINAL_STATE
};

tmopt_os &operator<<(tmopt_os &o, give_up_reason r);

// One-way transition running -> given up. The first reason is kept.
class give_up_latch {
  bool m_given_up;
  give_up_reason m_reason;

public:
  give_up_latch() : m_given_up(false), m_reason(GU_NONE) {}

  bool is_given_up() const { return m_given_up; }

  give_up_reason reason() const { return m_reason; }

  void give_up(give_up_reason r);
};

class state_propagator;

class state_propagator_operations
    : public dataflow_operations_api<cfg::cfg, domains::node_set_domain> {

  friend class state_propagator;

public:
  using node_set_domain_t = domains::node_set_domain;
  using node_t = cfg::cfg::node_t;

private:
  using parent_type = dataflow_operations_api<cfg::cfg, node_set_domain_t>;

  const shadows::shadow &m_initial_shadow;
  const automaton::tracematch &m_tm;
  const transition_oracle &m_transitions;
  const side_effect_oracle &m_side_effects;
  const cfg::statement *m_initial_stmt;
  node_set_domain_t m_initial_states;
  bool m_initialized_initial;
  binding_maps m_bindings;
  give_up_latch m_latch;

  void give_up(give_up_reason r, const cfg::statement *s);

public:
  state_propagator_operations(const cfg::cfg &g,
                              const shadows::shadow_group &initial_group,
                              const shadows::shadow &initial_shadow,
                              const shadows::shadow_registry &registry,
                              const transition_oracle &transitions,
                              const side_effect_oracle &side_effects);

  virtual node_set_domain_t entry() override { return node_set_domain_t(); }

  virtual node_set_domain_t initial() override { return node_set_domain_t(); }

  virtual void init_fixpoint() override {}

  virtual void merge(const node_set_domain_t &in1,
                     const node_set_domain_t &in2,
                     node_set_domain_t &out) override;

  virtual void copy(const node_set_domain_t &src,
                    node_set_domain_t &dest) override;

  virtual void flow_through(node_t s, node_set_domain_t &in,
                            node_set_domain_t &out) override;

  virtual std::string name() override { return "StatePropagator"; }
};

class state_propagator {
  using fixpo_t =
      fwd_fixpoint_iterator<cfg::cfg, state_propagator_operations>;

public:
  using node_set_domain_t = domains::node_set_domain;

private:
  const cfg::cfg &m_cfg;
  // set when the side effects come from an abstracted call graph
  std::unique_ptr<side_effect_oracle> m_owned_side_effects;
  state_propagator_operations m_ops;
  fixpo_t m_fixpo;
  std::string m_name;

  void run();

public:
  // Analyze g assuming that the tracematch of initial_shadow is in an
  // initial configuration when initial_shadow is reached. The
  // statement hosting initial_shadow must belong to g.
  state_propagator(const cfg::cfg &g,
                   const shadows::shadow_group &initial_group,
                   const shadows::shadow &initial_shadow,
                   const shadows::shadow_registry &registry,
                   const cg::abstracted_call_graph &abstracted_cg,
                   const transition_oracle &transitions);

  state_propagator(const cfg::cfg &g,
                   const shadows::shadow_group &initial_group,
                   const shadows::shadow &initial_shadow,
                   const shadows::shadow_registry &registry,
                   const side_effect_oracle &side_effects,
                   const transition_oracle &transitions);

  state_propagator(const state_propagator &o) = delete;
  state_propagator &operator=(const state_propagator &o) = delete;

  // Return true if g never causes the tracematch to hit a final node
  // and always leaves it in an initial node on exit.
  bool is_safely_invariant() const;

  bool gave_up() const { return m_ops.m_latch.is_given_up(); }

  give_up_reason get_give_up_reason() const { return m_ops.m_latch.reason(); }

  const cfg::statement &get_initial_statement() const {
    return *m_ops.m_initial_stmt;
  }

  const node_set_domain_t &get_initial_states() const {
    return m_ops.m_initial_states;
  }

  const binding_maps &get_bindings() const { return m_ops.m_bindings; }

  const node_set_domain_t &get_flow_before(const cfg::statement &s) const;

  const node_set_domain_t &get_flow_after(const cfg::statement &s) const;

  unsigned get_iterations() const { return m_fixpo.get_iterations(); }

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const state_propagator &a) {
    a.write(o);
    return o;
  }
};

} // end namespace analysis
} // end namespace tmopt
