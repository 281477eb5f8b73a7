#include <tmopt/cfg/cfg.hpp>

#include <algorithm>

namespace tmopt {
namespace cfg {

cfg::cfg(std::string func_name) : m_func_name(func_name) {}

void cfg::check_node(const statement &s) const {
  if (!contains(s)) {
    TMOPT_ERROR("statement \"", s, "\" does not belong to the cfg of ",
                m_func_name);
  }
}

assign_stmt &cfg::assign(local lhs, value rhs) {
  return insert(new assign_stmt(lhs, rhs, m_stmts.size()));
}

assign_stmt &cfg::assign(local lhs, local rhs) {
  return assign(lhs, value::mk_local(rhs));
}

invoke_stmt &cfg::invoke(std::string callee, std::vector<local> args) {
  return insert(new invoke_stmt(callee, args, m_stmts.size()));
}

branch_stmt &cfg::branch(local cond) {
  return insert(new branch_stmt(cond, m_stmts.size()));
}

return_stmt &cfg::ret() {
  return insert(new return_stmt(boost::none, m_stmts.size()));
}

return_stmt &cfg::ret(local l) {
  return insert(new return_stmt(l, m_stmts.size()));
}

nop_stmt &cfg::nop(std::string label) {
  return insert(new nop_stmt(label, m_stmts.size()));
}

void cfg::add_edge(const statement &from, const statement &to) {
  check_node(from);
  check_node(to);
  node_list_t &succs = m_succs[from.index()];
  if (std::find(succs.begin(), succs.end(), &to) != succs.end()) {
    return;
  }
  succs.push_back(&to);
  m_preds[to.index()].push_back(&from);
}

void cfg::add_path(std::initializer_list<node_t> path) {
  node_t prev = nullptr;
  for (node_t n : path) {
    if (!n) {
      TMOPT_ERROR("cfg::add_path with a null statement");
    }
    if (prev) {
      add_edge(*prev, *n);
    }
    prev = n;
  }
}

const statement &cfg::at(std::size_t index) const {
  if (index >= m_stmts.size()) {
    TMOPT_ERROR("cfg::at: index ", index, " out of bounds in ", m_func_name);
  }
  return *m_stmts[index];
}

bool cfg::contains(const statement &s) const {
  return s.index() < m_stmts.size() && m_stmts[s.index()].get() == &s;
}

const cfg::node_list_t &cfg::next_nodes(node_t n) const {
  check_node(*n);
  return m_succs[n->index()];
}

const cfg::node_list_t &cfg::prev_nodes(node_t n) const {
  check_node(*n);
  return m_preds[n->index()];
}

cfg::node_list_t cfg::heads() const {
  node_list_t res;
  for (auto const &s : m_stmts) {
    if (s->index() == 0 || m_preds[s->index()].empty()) {
      res.push_back(s.get());
    }
  }
  return res;
}

cfg::node_list_t cfg::tails() const {
  node_list_t res;
  for (auto const &s : m_stmts) {
    if (m_succs[s->index()].empty()) {
      res.push_back(s.get());
    }
  }
  return res;
}

void cfg::write(tmopt_os &o) const {
  o << m_func_name << ":\n";
  for (auto const &s : m_stmts) {
    o << "  " << s->index() << ": " << *s;
    const node_list_t &succs = m_succs[s->index()];
    if (!succs.empty()) {
      o << " -> {";
      for (unsigned i = 0, sz = succs.size(); i < sz;) {
        o << succs[i]->index();
        ++i;
        if (i < sz) {
          o << ",";
        }
      }
      o << "}";
    }
    o << "\n";
  }
}

} // end namespace cfg
} // end namespace tmopt
