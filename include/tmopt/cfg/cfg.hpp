#pragma once

/*
 * Statement-level control-flow graph of a single procedure body.
 *
 * The graph owns its statements. Statements are numbered in insertion
 * order and that number is used to index every per-statement table of
 * the analyses. Edges are added explicitly:
 *
 *   cfg g("foo");
 *   auto &s1 = g.assign(x, y);
 *   auto &s2 = g.invoke("bar", {x});
 *   auto &s3 = g.ret();
 *   g.add_path({&s1, &s2, &s3});
 *
 * Heads are the first inserted statement together with every
 * statement without predecessors. Tails are the statements without
 * successors.
 *
 * Objects of the class cfg are not copyable.
 */

#include <tmopt/cfg/statement.hpp>
#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>

#include <boost/iterator/indirect_iterator.hpp>
#include <boost/range/iterator_range.hpp>

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace tmopt {
namespace cfg {

class cfg {
public:
  using statement_t = statement;
  using node_t = const statement *;
  using node_list_t = std::vector<node_t>;

private:
  using stmt_list_t = std::vector<std::unique_ptr<statement>>;

public:
  using const_iterator =
      boost::indirect_iterator<stmt_list_t::const_iterator, const statement>;

private:
  std::string m_func_name;
  stmt_list_t m_stmts;
  // indexed by statement index
  std::vector<node_list_t> m_succs;
  std::vector<node_list_t> m_preds;

  template <class Stmt> Stmt &insert(Stmt *s) {
    m_stmts.push_back(std::unique_ptr<statement>(s));
    m_succs.push_back(node_list_t());
    m_preds.push_back(node_list_t());
    return *s;
  }

  // Check that s belongs to this graph
  void check_node(const statement &s) const;

public:
  explicit cfg(std::string func_name);

  cfg(const cfg &o) = delete;
  cfg &operator=(const cfg &o) = delete;

  const std::string &get_func_name() const { return m_func_name; }

  /* Statement builders */
  assign_stmt &assign(local lhs, value rhs);
  assign_stmt &assign(local lhs, local rhs);
  invoke_stmt &invoke(std::string callee, std::vector<local> args);
  branch_stmt &branch(local cond);
  return_stmt &ret();
  return_stmt &ret(local l);
  nop_stmt &nop(std::string label = "");

  /* Edges */
  void add_edge(const statement &from, const statement &to);
  // add an edge between every two consecutive statements
  void add_path(std::initializer_list<node_t> path);

  /* Queries */
  const_iterator begin() const { return const_iterator(m_stmts.begin()); }
  const_iterator end() const { return const_iterator(m_stmts.end()); }

  std::size_t size() const { return m_stmts.size(); }

  bool empty() const { return m_stmts.empty(); }

  const statement &at(std::size_t index) const;

  bool contains(const statement &s) const;

  const node_list_t &next_nodes(node_t n) const;

  const node_list_t &prev_nodes(node_t n) const;

  node_list_t heads() const;

  node_list_t tails() const;

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const cfg &g) {
    g.write(o);
    return o;
  }
};

} // end namespace cfg
} // end namespace tmopt
