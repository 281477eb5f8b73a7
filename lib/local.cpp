#include <tmopt/cfg/local.hpp>

#include <limits>

namespace tmopt {
namespace cfg {

std::size_t local_factory::get_and_increment_id() {
  if (m_next_id == std::numeric_limits<std::size_t>::max()) {
    TMOPT_ERROR("Reached limit of ", std::numeric_limits<std::size_t>::max(),
                " locals");
  }
  return m_next_id++;
}

local local_factory::operator[](const std::string &name) {
  auto it = m_map.find(name);
  if (it != m_map.end()) {
    return it->second;
  }
  local l(get_and_increment_id(), name);
  m_map.insert({name, l});
  return l;
}

local local_factory::get(std::string name) {
  std::size_t id = get_and_increment_id();
  if (name.empty()) {
    // unlikely prefix
    name = "$t_" + std::to_string(id);
  }
  return local(id, name);
}

} // end namespace cfg
} // end namespace tmopt
