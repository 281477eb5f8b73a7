#pragma once

/*
 * Transition oracle driven by the shadows attached to each statement.
 *
 * A statement without active shadows of the tracematch leaves the
 * automaton where it is. Otherwise each active shadow fires its
 * symbol. If the shadow must refer to the tracked objects (each
 * formal it binds is the tracked local, directly or through an advice
 * local) the automaton follows the edges of the symbol, and drops
 * back to its initial configuration if there are none. If it only may
 * refer to them the automaton may also stay where it is.
 *
 * Skip loops are not modelled: a shadow that binds a local never
 * assigned to an advice local is treated as "may refer".
 */

#include <tmopt/analysis/oracles.hpp>
#include <tmopt/shadows/shadow.hpp>

#include <string>

namespace tmopt {
namespace analysis {

class shadow_transition_oracle : public transition_oracle {
  const shadows::shadow_registry &m_registry;
  // procedure whose statements are queried
  std::string m_method;

  bool must_refer(const shadows::shadow &sh,
                  const formal_to_local_map_t &formal_to_local,
                  const actual_to_local_map_t &actual_to_local) const;

public:
  shadow_transition_oracle(const shadows::shadow_registry &registry,
                           std::string method)
      : m_registry(registry), m_method(method) {}

  virtual domains::node_set_domain
  successors(const automaton::sm_node &n, const automaton::tracematch &tm,
             const cfg::statement &s,
             const domains::node_set_domain &initial_nodes,
             const formal_to_local_map_t &formal_to_local,
             const actual_to_local_map_t &actual_to_local) const override;
};

} // end namespace analysis
} // end namespace tmopt
