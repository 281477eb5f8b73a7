#pragma once

/**
 * Set-based domain over automaton nodes.
 *
 * Given the nodes N of a state machine, the domain is the finite
 * lattice of all subsets of N ordered by inclusion. The empty set is
 * the most precise element (no configuration of the automaton can be
 * active) and N is the least precise one. Join is set union.
 *
 * Elements are non-owning pointers to nodes. Sets are ordered by node
 * index so that printing and iteration are deterministic.
 **/

#include <tmopt/automaton/state_machine.hpp>
#include <tmopt/support/os.hpp>

#include <algorithm>
#include <iterator>
#include <set>
#include <vector>

namespace tmopt {
namespace domains {

struct sm_node_compare {
  bool operator()(const automaton::sm_node *n1,
                  const automaton::sm_node *n2) const {
    return n1->index() < n2->index();
  }
};

class node_set_domain {
  using set_t = std::set<const automaton::sm_node *, sm_node_compare>;
  using node_set_domain_t = node_set_domain;

public:
  using element_t = const automaton::sm_node *;
  using iterator = set_t::const_iterator;

private:
  set_t m_set;

public:
  // Default constructor creates an empty set
  node_set_domain() {}

  template <typename Iterator> node_set_domain(Iterator it, Iterator et) {
    for (; it != et; ++it) {
      m_set.insert(*it);
    }
  }

  node_set_domain(const node_set_domain_t &other) = default;
  node_set_domain(node_set_domain_t &&other) = default;
  node_set_domain_t &operator=(const node_set_domain_t &other) = default;
  node_set_domain_t &operator=(node_set_domain_t &&other) = default;

  // Return an empty set
  static node_set_domain_t bottom() { return node_set_domain_t(); }

  bool is_bottom() const { return m_set.empty(); }

  bool operator<=(const node_set_domain_t &other) const {
    return std::includes(other.m_set.begin(), other.m_set.end(),
                         m_set.begin(), m_set.end(), sm_node_compare());
  }

  bool operator==(const node_set_domain_t &other) const {
    return m_set == other.m_set;
  }

  bool operator!=(const node_set_domain_t &other) const {
    return !(*this == other);
  }

  void operator|=(const node_set_domain_t &other) {
    m_set.insert(other.begin(), other.end());
  }

  node_set_domain_t operator|(const node_set_domain_t &other) const {
    node_set_domain_t res(*this);
    res |= other;
    return res;
  }

  node_set_domain_t operator&(const node_set_domain_t &other) const {
    node_set_domain_t res;
    std::set_intersection(m_set.begin(), m_set.end(), other.m_set.begin(),
                          other.m_set.end(),
                          std::inserter(res.m_set, res.m_set.end()),
                          sm_node_compare());
    return res;
  }

  node_set_domain_t &operator+=(element_t n) {
    m_set.insert(n);
    return *this;
  }

  template <typename Range> node_set_domain_t &operator+=(const Range &ns) {
    for (element_t n : ns) {
      m_set.insert(n);
    }
    return *this;
  }

  node_set_domain_t &operator-=(element_t n) {
    m_set.erase(n);
    return *this;
  }

  bool contain(element_t n) const { return m_set.count(n) > 0; }

  void clear() { m_set.clear(); }

  std::size_t size() const { return m_set.size(); }

  iterator begin() const { return m_set.begin(); }

  iterator end() const { return m_set.end(); }

  void write(tmopt_os &o) const {
    o << "{";
    for (auto it = m_set.begin(), et = m_set.end(); it != et;) {
      o << **it;
      ++it;
      if (it != et) {
        o << ",";
      }
    }
    o << "}";
  }

  friend tmopt_os &operator<<(tmopt_os &o, const node_set_domain_t &d) {
    d.write(o);
    return o;
  }
};

} // end namespace domains
} // end namespace tmopt
