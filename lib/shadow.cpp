#include <tmopt/shadows/shadow.hpp>

#include <algorithm>

namespace tmopt {
namespace shadows {

/* shadow */

shadow::shadow(std::size_t id, const automaton::tracematch &tm,
               std::string container, std::string symbol,
               bindings_t bindings)
    : m_id(id), m_tm(&tm), m_container(container), m_symbol(symbol),
      m_bindings(bindings) {
  if (!m_tm->has_symbol(m_symbol)) {
    TMOPT_ERROR("shadow symbol ", m_symbol,
                " is not in the alphabet of tracematch ", m_tm->get_name());
  }
  for (auto const &kv : m_bindings) {
    if (!m_tm->has_formal(kv.first)) {
      TMOPT_ERROR("shadow binds ", kv.first,
                  " which is not a formal of tracematch ", m_tm->get_name());
    }
  }
}

std::set<cfg::local> shadow::get_bound_locals() const {
  std::set<cfg::local> res;
  for (auto const &kv : m_bindings) {
    res.insert(kv.second);
  }
  return res;
}

bool shadow::is_bound_local(const cfg::local &l) const {
  for (auto const &kv : m_bindings) {
    if (kv.second == l) {
      return true;
    }
  }
  return false;
}

const std::string &shadow::get_var_name_for_local(const cfg::local &l) const {
  for (auto const &kv : m_bindings) {
    if (kv.second == l) {
      return kv.first;
    }
  }
  TMOPT_ERROR("local ", l, " is not bound by shadow ", *this);
}

boost::optional<cfg::local>
shadow::get_local_for_var(const std::string &var) const {
  auto it = m_bindings.find(var);
  if (it == m_bindings.end()) {
    return boost::none;
  }
  return it->second;
}

void shadow::write(tmopt_os &o) const {
  o << m_tm->get_name() << "." << m_symbol << "#" << m_id << "@"
    << m_container << "(";
  bool first = true;
  for (auto const &kv : m_bindings) {
    if (!first)
      o << ",";
    first = false;
    o << kv.first << "=" << kv.second;
  }
  o << ")";
}

/* shadow_group */

void shadow_group::add(const shadow &s) {
  if (!contains(s)) {
    m_shadows.push_back(&s);
  }
}

bool shadow_group::contains(const shadow &s) const {
  return std::find(m_shadows.begin(), m_shadows.end(), &s) != m_shadows.end();
}

void shadow_group::write(tmopt_os &o) const {
  o << "group " << m_label << "={";
  for (unsigned i = 0, sz = m_shadows.size(); i < sz;) {
    o << *m_shadows[i];
    ++i;
    if (i < sz) {
      o << ",";
    }
  }
  o << "}";
}

/* shadow_registry */

const shadow &shadow_registry::add_shadow(const cfg::statement &host,
                                          const automaton::tracematch &tm,
                                          std::string container,
                                          std::string symbol,
                                          shadow::bindings_t bindings) {
  std::unique_ptr<shadow> s(
      new shadow(m_shadows.size(), tm, container, symbol, bindings));
  const shadow *res = s.get();
  m_shadows.push_back(std::move(s));
  m_host_map[&host].push_back(res);
  return *res;
}

void shadow_registry::disable(const shadow &s) { m_disabled.insert(s.index()); }

bool shadow_registry::is_enabled(const shadow &s) const {
  return m_disabled.count(s.index()) == 0;
}

std::vector<const shadow *>
shadow_registry::all_active_shadows_for_host(const cfg::statement &s,
                                             const std::string &method) const {
  std::vector<const shadow *> res;
  auto it = m_host_map.find(&s);
  if (it == m_host_map.end()) {
    return res;
  }
  for (const shadow *sh : it->second) {
    if (sh->get_container() == method && is_enabled(*sh)) {
      res.push_back(sh);
    }
  }
  return res;
}

} // end namespace shadows
} // end namespace tmopt
