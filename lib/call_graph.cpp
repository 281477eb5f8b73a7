#include <tmopt/cg/call_graph.hpp>

#include <boost/range/iterator_range.hpp>

namespace tmopt {
namespace cg {

abstracted_call_graph::abstracted_call_graph() : m_cg(new cg_t()) {}

abstracted_call_graph::vertex_descriptor_t
abstracted_call_graph::get_or_add_callsite(const cfg::statement &callsite) {
  auto it = m_callsite_map.find(&callsite);
  if (it != m_callsite_map.end()) {
    return it->second;
  }
  vertex_descriptor_t v = boost::add_vertex(*m_cg);
  (*m_cg)[v].callsite = &callsite;
  m_callsite_map.insert({&callsite, v});
  TMOPT_LOG("cg", tmopt::outs() << "Added call site " << callsite
                                << " --- id=" << v << "\n";);
  return v;
}

abstracted_call_graph::vertex_descriptor_t
abstracted_call_graph::get_or_add_method(const std::string &method) {
  auto it = m_method_map.find(method);
  if (it != m_method_map.end()) {
    return it->second;
  }
  vertex_descriptor_t v = boost::add_vertex(*m_cg);
  (*m_cg)[v].callsite = nullptr;
  (*m_cg)[v].method = method;
  m_method_map.insert({method, v});
  TMOPT_LOG("cg", tmopt::outs() << "Added procedure " << method
                                << " --- id=" << v << "\n";);
  return v;
}

void abstracted_call_graph::add_edge(const cfg::statement &callsite,
                                     const std::string &callee) {
  if (callee.empty()) {
    TMOPT_ERROR("call graph edge from ", callsite, " without callee");
  }
  vertex_descriptor_t from = get_or_add_callsite(callsite);
  vertex_descriptor_t to = get_or_add_method(callee);
  auto res = boost::add_edge(from, to, *m_cg);
  if (res.second) {
    TMOPT_LOG("cg", tmopt::outs() << "Added cg edge " << callsite << " --> "
                                  << callee << "\n";);
  }
}

bool abstracted_call_graph::has_edges_out_of(
    const cfg::statement &callsite) const {
  auto it = m_callsite_map.find(&callsite);
  if (it == m_callsite_map.end()) {
    return false;
  }
  return boost::out_degree(it->second, *m_cg) > 0;
}

std::vector<std::string>
abstracted_call_graph::edges_out_of(const cfg::statement &callsite) const {
  std::vector<std::string> res;
  auto it = m_callsite_map.find(&callsite);
  if (it == m_callsite_map.end()) {
    return res;
  }
  for (auto e : boost::make_iterator_range(boost::out_edges(it->second, *m_cg))) {
    res.push_back((*m_cg)[boost::target(e, *m_cg)].method);
  }
  return res;
}

std::size_t abstracted_call_graph::num_edges() const {
  return boost::num_edges(*m_cg);
}

void abstracted_call_graph::write(tmopt_os &o) const {
  o << "abstracted call graph:\n";
  for (auto const &kv : m_callsite_map) {
    for (auto e : boost::make_iterator_range(boost::out_edges(kv.second, *m_cg))) {
      o << "  " << *kv.first << " --> "
        << (*m_cg)[boost::target(e, *m_cg)].method << "\n";
    }
  }
}

} // end namespace cg
} // end namespace tmopt
