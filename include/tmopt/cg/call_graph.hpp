#pragma once

/*
 * Abstracted call graph.
 *
 * The graph keeps only the call edges that matter for trace
 * monitoring: there is an edge from a call site to a procedure if
 * executing the call may transitively reach a shadow of some
 * tracematch. A call site without outgoing edges cannot trigger any
 * event, wherever it is in the program.
 */

#include <tmopt/cfg/statement.hpp>
#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/graph_traits.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tmopt {
namespace cg {

class abstracted_call_graph {
  /// --- begin internal representation of the call graph
  struct vertex_t {
    // null if the vertex is a procedure
    const cfg::statement *callsite;
    std::string method;
  };
  using cg_t = boost::adjacency_list<boost::setS, // disallow parallel edges
                                     boost::vecS, boost::directedS, vertex_t>;
  using vertex_descriptor_t = boost::graph_traits<cg_t>::vertex_descriptor;
  using out_edge_iterator = boost::graph_traits<cg_t>::out_edge_iterator;
  /// --- end internal representation of the call graph

  std::unique_ptr<cg_t> m_cg;
  std::unordered_map<const cfg::statement *, vertex_descriptor_t>
      m_callsite_map;
  std::unordered_map<std::string, vertex_descriptor_t> m_method_map;

  vertex_descriptor_t get_or_add_callsite(const cfg::statement &callsite);
  vertex_descriptor_t get_or_add_method(const std::string &method);

public:
  abstracted_call_graph();

  abstracted_call_graph(const abstracted_call_graph &o) = delete;
  abstracted_call_graph &operator=(const abstracted_call_graph &o) = delete;

  // Record that callsite may transitively trigger a shadow through
  // callee.
  void add_edge(const cfg::statement &callsite, const std::string &callee);

  bool has_edges_out_of(const cfg::statement &callsite) const;

  // Return the callees reachable from callsite
  std::vector<std::string> edges_out_of(const cfg::statement &callsite) const;

  std::size_t num_edges() const;

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const abstracted_call_graph &cg) {
    cg.write(o);
    return o;
  }
};

} // end namespace cg
} // end namespace tmopt
