#ifndef __TESTS_COMMON__
#define __TESTS_COMMON__

/* To be included by all the tests */

#include <tmopt/config.h>
#include <tmopt/analysis/bindings.hpp>
#include <tmopt/analysis/oracles.hpp>
#include <tmopt/analysis/shadow_transition_oracle.hpp>
#include <tmopt/analysis/state_propagator.hpp>
#include <tmopt/automaton/state_machine.hpp>
#include <tmopt/automaton/tracematch.hpp>
#include <tmopt/cfg/cfg.hpp>
#include <tmopt/cfg/local.hpp>
#include <tmopt/cfg/statement.hpp>
#include <tmopt/cg/call_graph.hpp>
#include <tmopt/domains/node_set_domain.hpp>
#include <tmopt/shadows/shadow.hpp>
#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>
#include <tmopt/support/stats.hpp>

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tmopt_tests {

using namespace tmopt;
using namespace tmopt::analysis;
using namespace tmopt::automaton;
using tmopt::cfg::local;
using tmopt::cfg::local_factory;
using tmopt::cfg::statement;
using tmopt::cfg::value;
using cfg_t = tmopt::cfg::cfg;
using namespace tmopt::cg;
using namespace tmopt::domains;
using namespace tmopt::shadows;

// Records the outcome of every check. main returns result().
class checker {
  unsigned m_checks;
  unsigned m_failures;

public:
  checker() : m_checks(0), m_failures(0) {}

  void expect(bool cond, const std::string &what) {
    ++m_checks;
    if (cond) {
      tmopt::outs() << "OK: " << what << "\n";
    } else {
      ++m_failures;
      tmopt::errs() << "FAILED: " << what << "\n";
    }
  }

  // Run f and expect it to raise a tmopt_exception
  template <typename F> void expect_error(F f, const std::string &what) {
    bool raised = false;
    try {
      f();
    } catch (tmopt::tmopt_exception &e) {
      tmopt::outs() << "Caught \"" << e.what() << "\"\n";
      raised = true;
    }
    expect(raised, what);
  }

  int result() const {
    tmopt::outs() << (m_checks - m_failures) << "/" << m_checks
                  << " checks passed\n";
    return (m_failures == 0 ? 0 : 1);
  }
};

inline node_set_domain mk_set(std::vector<const sm_node *> ns) {
  return node_set_domain(ns.begin(), ns.end());
}

// The automaton stays where it is
class identity_transition_oracle : public transition_oracle {
public:
  virtual node_set_domain
  successors(const sm_node &n, const tracematch &tm, const statement &s,
             const node_set_domain &initial_nodes,
             const formal_to_local_map_t &formal_to_local,
             const actual_to_local_map_t &actual_to_local) const override {
    node_set_domain res;
    res += &n;
    return res;
  }
};

// Successors given by a table keyed by (node, statement). Pairs
// missing from the table leave the automaton where it is.
class table_transition_oracle : public transition_oracle {
  using key_t = std::pair<std::size_t, std::size_t>;
  std::map<key_t, std::vector<const sm_node *>> m_table;

public:
  void add(const sm_node &from, const statement &s,
           std::vector<const sm_node *> to) {
    m_table[key_t(from.index(), s.index())] = to;
  }

  virtual node_set_domain
  successors(const sm_node &n, const tracematch &tm, const statement &s,
             const node_set_domain &initial_nodes,
             const formal_to_local_map_t &formal_to_local,
             const actual_to_local_map_t &actual_to_local) const override {
    auto it = m_table.find(key_t(n.index(), s.index()));
    if (it == m_table.end()) {
      node_set_domain res;
      res += &n;
      return res;
    }
    return mk_set(it->second);
  }
};

// Only the registered statements may trigger events
class set_side_effect_oracle : public side_effect_oracle {
  std::set<const statement *> m_stmts;

public:
  void add(const statement &s) { m_stmts.insert(&s); }

  virtual bool may_trigger(const statement &s) const override {
    return m_stmts.count(&s) > 0;
  }
};

/*
 * Tracematch over one iterator:
 *
 *   s0 (initial) --next--> s1 --next--> s2 (final)
 *   s1 --hasNext--> s0
 *
 * i.e., it fires if next is called twice without calling hasNext in
 * between.
 */
struct has_next_tm {
  tracematch tm;
  const sm_node &s0;
  const sm_node &s1;
  const sm_node &s2;

  has_next_tm()
      : tm("HasNext", {"i"}, {"hasNext", "next"}), s0(tm.new_state(true, false)),
        s1(tm.new_state(false, false)), s2(tm.new_state(false, true)) {
    tm.new_transition(s0, "next", s1);
    tm.new_transition(s1, "next", s2);
    tm.new_transition(s1, "hasNext", s0);
  }
};

} // namespace tmopt_tests

#endif
