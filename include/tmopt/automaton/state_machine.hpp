#pragma once

/*
 * Finite state machine of a tracematch.
 *
 * Nodes are owned by their machine and never move, so clients can
 * hold plain pointers to them for as long as the machine lives.
 * Edges are labelled with the symbols of the tracematch alphabet. The
 * machine is populated through its tracematch (see tracematch.hpp),
 * which checks that every label belongs to the alphabet.
 */

#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>

#include <boost/iterator/indirect_iterator.hpp>
#include <boost/range/iterator_range.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tmopt {
namespace automaton {

class state_machine;

class sm_node {
  friend class state_machine;

  std::size_t m_id;
  bool m_initial;
  bool m_final;
  const state_machine *m_owner;

  sm_node(std::size_t id, bool initial, bool final, const state_machine *owner)
      : m_id(id), m_initial(initial), m_final(final), m_owner(owner) {}

public:
  sm_node(const sm_node &o) = delete;
  sm_node &operator=(const sm_node &o) = delete;

  std::size_t index() const { return m_id; }

  bool is_initial_node() const { return m_initial; }

  bool is_final_node() const { return m_final; }

  const state_machine &get_owner() const { return *m_owner; }

  void write(tmopt_os &o) const {
    o << "s" << m_id;
    if (m_initial || m_final) {
      o << "(";
      if (m_initial)
        o << "I";
      if (m_final)
        o << "F";
      o << ")";
    }
  }

  friend tmopt_os &operator<<(tmopt_os &o, const sm_node &n) {
    n.write(o);
    return o;
  }
};

class state_machine {
  friend class tracematch;

  using node_list_t = std::vector<std::unique_ptr<sm_node>>;
  using edge_key_t = std::pair<std::size_t, std::string>;
  using edge_map_t = std::map<edge_key_t, std::vector<const sm_node *>>;

  node_list_t m_nodes;
  edge_map_t m_edges;

  const sm_node &new_state(bool initial, bool final);

  void new_transition(const sm_node &from, const std::string &symbol,
                      const sm_node &to);

  void check_node(const sm_node &n) const;

public:
  using state_iterator =
      boost::indirect_iterator<node_list_t::const_iterator, const sm_node>;

  state_machine() {}

  state_machine(const state_machine &o) = delete;
  state_machine &operator=(const state_machine &o) = delete;

  state_iterator state_begin() const { return state_iterator(m_nodes.begin()); }
  state_iterator state_end() const { return state_iterator(m_nodes.end()); }

  boost::iterator_range<state_iterator> states() const {
    return boost::make_iterator_range(state_begin(), state_end());
  }

  std::size_t num_states() const { return m_nodes.size(); }

  std::size_t num_transitions() const;

  // Return the targets of the edges labelled with symbol leaving n
  std::vector<const sm_node *> successors(const sm_node &n,
                                          const std::string &symbol) const;

  std::vector<const sm_node *> initial_states() const;

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const state_machine &sm) {
    sm.write(o);
    return o;
  }
};

} // end namespace automaton
} // end namespace tmopt
