#include <tmopt/automaton/state_machine.hpp>
#include <tmopt/automaton/tracematch.hpp>

#include <algorithm>

namespace tmopt {
namespace automaton {

/* state_machine */

void state_machine::check_node(const sm_node &n) const {
  if (&n.get_owner() != this) {
    TMOPT_ERROR("automaton node ", n, " belongs to another state machine");
  }
}

const sm_node &state_machine::new_state(bool initial, bool final) {
  m_nodes.push_back(std::unique_ptr<sm_node>(
      new sm_node(m_nodes.size(), initial, final, this)));
  return *m_nodes.back();
}

void state_machine::new_transition(const sm_node &from,
                                   const std::string &symbol,
                                   const sm_node &to) {
  check_node(from);
  check_node(to);
  std::vector<const sm_node *> &targets =
      m_edges[edge_key_t(from.index(), symbol)];
  if (std::find(targets.begin(), targets.end(), &to) == targets.end()) {
    targets.push_back(&to);
  }
}

std::size_t state_machine::num_transitions() const {
  std::size_t res = 0;
  for (auto const &kv : m_edges) {
    res += kv.second.size();
  }
  return res;
}

std::vector<const sm_node *>
state_machine::successors(const sm_node &n, const std::string &symbol) const {
  check_node(n);
  auto it = m_edges.find(edge_key_t(n.index(), symbol));
  if (it == m_edges.end()) {
    return std::vector<const sm_node *>();
  }
  return it->second;
}

std::vector<const sm_node *> state_machine::initial_states() const {
  std::vector<const sm_node *> res;
  for (auto const &n : states()) {
    if (n.is_initial_node()) {
      res.push_back(&n);
    }
  }
  return res;
}

void state_machine::write(tmopt_os &o) const {
  o << "states={";
  for (unsigned i = 0, sz = m_nodes.size(); i < sz;) {
    o << *m_nodes[i];
    ++i;
    if (i < sz) {
      o << ",";
    }
  }
  o << "}\n";
  for (auto const &kv : m_edges) {
    for (const sm_node *to : kv.second) {
      o << "  " << *m_nodes[kv.first.first] << " --" << kv.first.second
        << "--> " << *to << "\n";
    }
  }
}

/* tracematch */

tracematch::tracematch(std::string name, std::vector<std::string> formals,
                       std::set<std::string> symbols)
    : m_name(name), m_formals(formals), m_symbols(symbols) {}

bool tracematch::has_formal(const std::string &formal) const {
  return std::find(m_formals.begin(), m_formals.end(), formal) !=
         m_formals.end();
}

bool tracematch::has_symbol(const std::string &symbol) const {
  return m_symbols.count(symbol) > 0;
}

const sm_node &tracematch::new_state(bool initial, bool final) {
  return m_sm.new_state(initial, final);
}

void tracematch::new_transition(const sm_node &from, const std::string &symbol,
                                const sm_node &to) {
  if (!has_symbol(symbol)) {
    TMOPT_ERROR("symbol ", symbol, " is not in the alphabet of tracematch ",
                m_name);
  }
  m_sm.new_transition(from, symbol, to);
}

void tracematch::write(tmopt_os &o) const {
  o << "tracematch " << m_name << "(";
  for (unsigned i = 0, sz = m_formals.size(); i < sz;) {
    o << m_formals[i];
    ++i;
    if (i < sz) {
      o << ",";
    }
  }
  o << ") symbols={";
  bool first = true;
  for (auto const &sym : m_symbols) {
    if (!first)
      o << ",";
    first = false;
    o << sym;
  }
  o << "}\n" << m_sm;
}

} // end namespace automaton
} // end namespace tmopt
