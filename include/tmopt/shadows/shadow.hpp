#pragma once

/*
 * Shadows are the program points where an event of a tracematch may
 * fire. A shadow records which tracematch it belongs to, the
 * procedure that contains it, the symbol it fires and the locals that
 * realize the free variables of the tracematch at that point.
 */

#include <tmopt/automaton/tracematch.hpp>
#include <tmopt/cfg/local.hpp>
#include <tmopt/cfg/statement.hpp>
#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>

#include <boost/optional.hpp>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmopt {
namespace shadows {

class shadow_registry;

class shadow {
  friend class shadow_registry;

public:
  // tracematch formal -> local
  using bindings_t = std::map<std::string, cfg::local>;

private:
  std::size_t m_id;
  const automaton::tracematch *m_tm;
  std::string m_container;
  std::string m_symbol;
  bindings_t m_bindings;

  shadow(std::size_t id, const automaton::tracematch &tm, std::string container,
         std::string symbol, bindings_t bindings);

public:
  shadow(const shadow &o) = delete;
  shadow &operator=(const shadow &o) = delete;

  std::size_t index() const { return m_id; }

  const automaton::tracematch &get_tracematch() const { return *m_tm; }

  // name of the procedure containing the shadow
  const std::string &get_container() const { return m_container; }

  const std::string &get_symbol() const { return m_symbol; }

  const bindings_t &get_bindings() const { return m_bindings; }

  std::set<cfg::local> get_bound_locals() const;

  bool is_bound_local(const cfg::local &l) const;

  // Return the formal bound to l. l must be a bound local.
  const std::string &get_var_name_for_local(const cfg::local &l) const;

  boost::optional<cfg::local> get_local_for_var(const std::string &var) const;

  bool operator==(const shadow &o) const { return m_id == o.m_id; }
  bool operator!=(const shadow &o) const { return !(*this == o); }
  bool operator<(const shadow &o) const { return m_id < o.m_id; }

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const shadow &s) {
    s.write(o);
    return o;
  }
};

// Shadows sharing a common variable-binding context
class shadow_group {
  std::string m_label;
  std::vector<const shadow *> m_shadows;

public:
  using const_iterator = std::vector<const shadow *>::const_iterator;

  explicit shadow_group(std::string label = "") : m_label(label) {}

  const std::string &get_label() const { return m_label; }

  void add(const shadow &s);

  bool contains(const shadow &s) const;

  const std::vector<const shadow *> &get_all_shadows() const {
    return m_shadows;
  }

  const_iterator begin() const { return m_shadows.begin(); }
  const_iterator end() const { return m_shadows.end(); }
  std::size_t size() const { return m_shadows.size(); }

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const shadow_group &g) {
    g.write(o);
    return o;
  }
};

/*
 * Owns every shadow of the program and knows at which statement each
 * of them is attached. Shadows can be disabled, e.g., once an
 * optimization has removed them, after which they are no longer
 * reported as active.
 */
class shadow_registry {
  std::vector<std::unique_ptr<shadow>> m_shadows;
  std::unordered_map<const cfg::statement *, std::vector<const shadow *>>
      m_host_map;
  std::set<std::size_t> m_disabled;

public:
  shadow_registry() {}

  shadow_registry(const shadow_registry &o) = delete;
  shadow_registry &operator=(const shadow_registry &o) = delete;

  // Create a shadow of tm attached to host. container is the name of
  // the procedure containing host.
  const shadow &add_shadow(const cfg::statement &host,
                           const automaton::tracematch &tm,
                           std::string container, std::string symbol,
                           shadow::bindings_t bindings);

  void disable(const shadow &s);

  bool is_enabled(const shadow &s) const;

  // Return the enabled shadows attached to s whose container is
  // method.
  std::vector<const shadow *>
  all_active_shadows_for_host(const cfg::statement &s,
                              const std::string &method) const;

  std::size_t size() const { return m_shadows.size(); }
};

} // end namespace shadows
} // end namespace tmopt
