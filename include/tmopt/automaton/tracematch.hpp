#pragma once

#include <tmopt/automaton/state_machine.hpp>
#include <tmopt/support/os.hpp>

#include <set>
#include <string>
#include <vector>

namespace tmopt {
namespace automaton {

/*
 * A temporal property monitored at runtime: a name, the free
 * variables (formals) its events bind, the alphabet of symbols and
 * the state machine that recognizes the property.
 */
class tracematch {
  std::string m_name;
  std::vector<std::string> m_formals;
  std::set<std::string> m_symbols;
  state_machine m_sm;

public:
  tracematch(std::string name, std::vector<std::string> formals,
             std::set<std::string> symbols);

  tracematch(const tracematch &o) = delete;
  tracematch &operator=(const tracematch &o) = delete;

  const std::string &get_name() const { return m_name; }

  const std::vector<std::string> &get_formals() const { return m_formals; }

  bool has_formal(const std::string &formal) const;

  const std::set<std::string> &get_symbols() const { return m_symbols; }

  bool has_symbol(const std::string &symbol) const;

  const state_machine &get_state_machine() const { return m_sm; }

  /* Build the state machine */
  const sm_node &new_state(bool initial, bool final);
  void new_transition(const sm_node &from, const std::string &symbol,
                      const sm_node &to);

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const tracematch &tm) {
    tm.write(o);
    return o;
  }
};

} // end namespace automaton
} // end namespace tmopt
