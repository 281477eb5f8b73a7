#pragma once

/*
 * Capabilities the state propagation analysis queries about the rest
 * of the program.
 */

#include <tmopt/analysis/bindings.hpp>
#include <tmopt/automaton/tracematch.hpp>
#include <tmopt/cfg/statement.hpp>
#include <tmopt/cg/call_graph.hpp>
#include <tmopt/domains/node_set_domain.hpp>

namespace tmopt {
namespace analysis {

// Successor automaton nodes when executing a statement.
//
// Implementations must be pure: the fixpoint calls them repeatedly
// and expects identical answers for identical inputs.
class transition_oracle {
public:
  virtual ~transition_oracle() {}

  virtual domains::node_set_domain
  successors(const automaton::sm_node &n, const automaton::tracematch &tm,
             const cfg::statement &s,
             const domains::node_set_domain &initial_nodes,
             const formal_to_local_map_t &formal_to_local,
             const actual_to_local_map_t &actual_to_local) const = 0;
};

// Whether executing a statement may trigger, directly or through its
// callees, an event of some tracematch anywhere in the program.
class side_effect_oracle {
public:
  virtual ~side_effect_oracle() {}

  virtual bool may_trigger(const cfg::statement &s) const = 0;
};

// Side effects as recorded by the abstracted call graph: a statement
// may trigger an event iff it has an outgoing call graph edge.
class call_graph_side_effect_oracle : public side_effect_oracle {
  const cg::abstracted_call_graph &m_cg;

public:
  call_graph_side_effect_oracle(const cg::abstracted_call_graph &cg)
      : m_cg(cg) {}

  virtual bool may_trigger(const cfg::statement &s) const override {
    return m_cg.has_edges_out_of(s);
  }
};

} // end namespace analysis
} // end namespace tmopt
