#include <tmopt/analysis/shadow_transition_oracle.hpp>
#include <tmopt/support/debug.hpp>

namespace tmopt {
namespace analysis {

bool shadow_transition_oracle::must_refer(
    const shadows::shadow &sh, const formal_to_local_map_t &formal_to_local,
    const actual_to_local_map_t &actual_to_local) const {
  for (auto const &kv : sh.get_bindings()) {
    auto tracked = formal_to_local.find(kv.first);
    if (tracked == formal_to_local.end()) {
      return false;
    }
    if (kv.second == tracked->second) {
      continue;
    }
    auto actual = actual_to_local.find(kv.second);
    if (actual == actual_to_local.end() || actual->second != tracked->second) {
      return false;
    }
  }
  return true;
}

domains::node_set_domain shadow_transition_oracle::successors(
    const automaton::sm_node &n, const automaton::tracematch &tm,
    const cfg::statement &s, const domains::node_set_domain &initial_nodes,
    const formal_to_local_map_t &formal_to_local,
    const actual_to_local_map_t &actual_to_local) const {

  const automaton::state_machine &sm = tm.get_state_machine();
  if (&n.get_owner() != &sm) {
    TMOPT_ERROR("automaton node ", n, " does not belong to tracematch ",
                tm.get_name());
  }

  domains::node_set_domain res;
  bool fired = false;
  for (const shadows::shadow *sh :
       m_registry.all_active_shadows_for_host(s, m_method)) {
    if (&sh->get_tracematch() != &tm) {
      continue;
    }
    fired = true;
    auto succs = sm.successors(n, sh->get_symbol());
    if (must_refer(*sh, formal_to_local, actual_to_local)) {
      if (succs.empty()) {
        // the partial match is discarded
        res |= initial_nodes;
      } else {
        res += succs;
      }
      TMOPT_LOG("transition", tmopt::outs()
                                  << n << " --" << sh->get_symbol()
                                  << "--> " << res << " (must) at \"" << s
                                  << "\"\n";);
    } else {
      res += &n;
      res += succs;
      TMOPT_LOG("transition", tmopt::outs()
                                  << n << " --" << sh->get_symbol()
                                  << "--> " << res << " (may) at \"" << s
                                  << "\"\n";);
    }
  }
  if (!fired) {
    res += &n;
  }
  return res;
}

} // end namespace analysis
} // end namespace tmopt
