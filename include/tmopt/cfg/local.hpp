#pragma once

/*
 * Local variables of a procedure body. A local is identified by an
 * index handed out by the local_factory of its procedure so that it
 * can be cheaply compared, ordered and hashed.
 */

#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace tmopt {
namespace cfg {

class local_factory;

class local {
  friend class local_factory;

  std::size_t m_id;
  std::shared_ptr<std::string> m_name;

  local(std::size_t id, std::string name)
      : m_id(id), m_name(std::make_shared<std::string>(name)) {}

public:
  local(const local &o) = default;
  local(local &&o) = default;
  local &operator=(const local &o) = default;
  local &operator=(local &&o) = default;

  std::size_t index() const { return m_id; }

  const std::string &name() const { return *m_name; }

  bool operator<(const local &o) const { return m_id < o.m_id; }
  bool operator==(const local &o) const { return m_id == o.m_id; }
  bool operator!=(const local &o) const { return !(*this == o); }

  std::size_t hash() const {
    std::hash<std::size_t> hasher;
    return hasher(m_id);
  }

  void write(tmopt_os &o) const { o << name(); }

  friend tmopt_os &operator<<(tmopt_os &o, const local &l) {
    l.write(o);
    return o;
  }
};

// Creates locals. Asking twice for the same name returns the same
// local.
class local_factory {
  std::size_t m_next_id;
  std::unordered_map<std::string, local> m_map;

  std::size_t get_and_increment_id();

public:
  local_factory() : m_next_id(1) {}

  local_factory(const local_factory &o) = delete;
  local_factory &operator=(const local_factory &o) = delete;

  local operator[](const std::string &name);

  // Fresh local that is never returned by operator[]
  local get(std::string name = "");
};

} // end namespace cfg
} // end namespace tmopt

namespace std {
template <> struct hash<tmopt::cfg::local> {
  size_t operator()(const tmopt::cfg::local &l) const { return l.hash(); }
};
} // end namespace std
