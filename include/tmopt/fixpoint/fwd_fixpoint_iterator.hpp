#pragma once

/**
 * Worklist fixpoint iterator for forward dataflow problems over a
 * statement-level CFG.
 *
 * The CFG must provide:
 *   - typename CFG::node_t, a pointer to a statement with index()
 *   - begin()/end() over its statements, size()
 *   - heads(), next_nodes(n), prev_nodes(n)
 *   - get_func_name()
 *
 * The flow before and after each statement is stored in tables
 * indexed by statement index. Each point owns its own domain value.
 *
 * A statement is visited once from the initial worklist and once per
 * growth of a predecessor's out. With a domain of height h this is at
 * most |statements| + |edges| * h visits.
 **/

#include <tmopt/support/debug.hpp>
#include <tmopt/support/stats.hpp>

#include <deque>
#include <string>
#include <vector>

namespace tmopt {

// API for the operations of a forward dataflow analysis
template <class CFG, class Dom> class dataflow_operations_api {

public:
  using node_t = typename CFG::node_t;
  using dataflow_domain_t = Dom;

protected:
  const CFG &m_cfg;

public:
  dataflow_operations_api(const CFG &cfg) : m_cfg(cfg) {}

  virtual ~dataflow_operations_api() {}

  // flow entering the heads of the CFG
  virtual Dom entry() = 0;

  // flow of every program point before the first visit
  virtual Dom initial() = 0;

  // (optional) initialization for the fixpoint
  virtual void init_fixpoint() = 0;

  // confluence operator: out := in1 join in2
  virtual void merge(const Dom &in1, const Dom &in2, Dom &out) = 0;

  // dest := src
  virtual void copy(const Dom &src, Dom &dest) = 0;

  // Transfer function of n. It can replace in, e.g., to seed the
  // analysis at a given statement. On entry out holds the flow
  // computed for n so far. The iterator joins the result with that
  // flow so outgoing flows never decrease.
  virtual void flow_through(node_t n, Dom &in, Dom &out) = 0;

  // analysis name
  virtual std::string name() = 0;
};

template <class CFG, class AnalysisOps> class fwd_fixpoint_iterator {

public:
  using node_t = typename CFG::node_t;
  using dataflow_domain_t = typename AnalysisOps::dataflow_domain_t;
  using inv_table_t = std::vector<dataflow_domain_t>;

protected:
  const CFG &m_cfg;
  inv_table_t m_in_table;
  inv_table_t m_out_table;

private:
  AnalysisOps &m_analysis;
  // number of statements visited
  unsigned m_iterations;

  // Reverse postorder of the statements reachable from the heads,
  // followed by the unreachable ones in insertion order.
  std::vector<node_t> compute_order() const {
    std::vector<node_t> postorder;
    std::vector<bool> visited(m_cfg.size(), false);
    // iterative dfs: (node, index of next successor to visit)
    std::vector<std::pair<node_t, unsigned>> stack;
    for (node_t h : m_cfg.heads()) {
      if (visited[h->index()])
        continue;
      visited[h->index()] = true;
      stack.push_back({h, 0});
      while (!stack.empty()) {
        node_t n = stack.back().first;
        const auto &succs = m_cfg.next_nodes(n);
        if (stack.back().second < succs.size()) {
          node_t s = succs[stack.back().second++];
          if (!visited[s->index()]) {
            visited[s->index()] = true;
            stack.push_back({s, 0});
          }
        } else {
          postorder.push_back(n);
          stack.pop_back();
        }
      }
    }
    std::vector<node_t> order(postorder.rbegin(), postorder.rend());
    for (auto const &s : m_cfg) {
      if (!visited[s.index()]) {
        order.push_back(&s);
      }
    }
    return order;
  }

  bool is_head(node_t n) const {
    return n->index() == 0 || m_cfg.prev_nodes(n).empty();
  }

  void run_fwd_fixpo(std::vector<node_t> &order) {
    order = compute_order();

    std::deque<node_t> worklist(order.begin(), order.end());
    std::vector<bool> in_worklist(m_cfg.size(), true);

    while (!worklist.empty()) {
      node_t n = worklist.front();
      worklist.pop_front();
      in_worklist[n->index()] = false;
      ++m_iterations;

      dataflow_domain_t in =
          (is_head(n) ? m_analysis.entry() : m_analysis.initial());
      for (node_t p : m_cfg.prev_nodes(n)) {
        m_analysis.merge(in, m_out_table[p->index()], in);
      }

      dataflow_domain_t old_out = m_out_table[n->index()];
      dataflow_domain_t out;
      m_analysis.copy(old_out, out);
      m_analysis.flow_through(n, in, out);
      // outgoing flows never decrease
      m_analysis.merge(out, old_out, out);

      m_analysis.merge(in, m_in_table[n->index()], m_in_table[n->index()]);
      if (!(out <= old_out)) {
        m_analysis.copy(out, m_out_table[n->index()]);
        for (node_t s : m_cfg.next_nodes(n)) {
          if (!in_worklist[s->index()]) {
            in_worklist[s->index()] = true;
            worklist.push_back(s);
          }
        }
      }
    }
  }

public:
  fwd_fixpoint_iterator(const CFG &cfg, AnalysisOps &analysis)
      : m_cfg(cfg), m_analysis(analysis), m_iterations(0) {
    // don't do anything with m_analysis in the constructor except
    // storing the reference.
  }

  fwd_fixpoint_iterator(const fwd_fixpoint_iterator &o) = delete;
  fwd_fixpoint_iterator &operator=(const fwd_fixpoint_iterator &o) = delete;

  void run() {
    TMOPT_SCOPED_STATS("Fixpo");

    m_in_table.assign(m_cfg.size(), m_analysis.initial());
    m_out_table.assign(m_cfg.size(), m_analysis.initial());
    m_iterations = 0;

    m_analysis.init_fixpoint();

    std::vector<node_t> order;
    run_fwd_fixpo(order);

    TMOPT_LOG("fixpoint",
              tmopt::outs() << m_analysis.name() << " for "
                            << m_cfg.get_func_name() << "\n";
              tmopt::outs() << "fixpoint ordering={";
              bool first = true;
              for (node_t n : order) {
                if (!first)
                  tmopt::outs() << ",";
                first = false;
                tmopt::outs() << n->index();
              }
              tmopt::outs() << "}\n";);

    TMOPT_LOG("fixpoint", tmopt::outs()
                              << m_analysis.name() << ": "
                              << "fixpoint reached after " << m_iterations
                              << " statement visits.\n";);
  }

  unsigned get_iterations() const { return m_iterations; }

  // return null if not found
  const dataflow_domain_t *get_in(node_t n) const {
    if (n->index() < m_in_table.size()) {
      return &m_in_table[n->index()];
    } else {
      return nullptr;
    }
  }

  // return null if not found
  const dataflow_domain_t *get_out(node_t n) const {
    if (n->index() < m_out_table.size()) {
      return &m_out_table[n->index()];
    } else {
      return nullptr;
    }
  }
};
} // end namespace tmopt
