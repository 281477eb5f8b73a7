#include <tmopt/analysis/bindings.hpp>
#include <tmopt/support/debug.hpp>

namespace tmopt {
namespace analysis {

namespace {
// Record the right-hand side of x = y
class local_copy_visitor : public cfg::statement_visitor {
  boost::optional<cfg::local> m_rhs;

public:
  virtual void visit(const cfg::assign_stmt &s) override {
    if (s.is_local_copy()) {
      m_rhs = s.rhs().get_local();
    }
  }

  const boost::optional<cfg::local> &get_rhs() const { return m_rhs; }
};
} // end namespace

bool binding_maps::is_trace_local(const cfg::local &l) const {
  for (auto const &kv : actual_to_local) {
    if (kv.second == l) {
      return true;
    }
  }
  return false;
}

void binding_maps::write(tmopt_os &o) const {
  o << "formal->local={";
  bool first = true;
  for (auto const &kv : formal_to_local) {
    if (!first)
      o << ",";
    first = false;
    o << kv.first << "->" << kv.second;
  }
  o << "} actual->local={";
  first = true;
  for (auto const &kv : actual_to_local) {
    if (!first)
      o << ",";
    first = false;
    o << kv.first << "->" << kv.second;
  }
  o << "}";
  if (unresolved) {
    o << " (unresolved)";
  }
}

binding_maps extract_bindings(const cfg::cfg &g,
                              const shadows::shadow_group &group,
                              const shadows::shadow &initial) {
  binding_maps res;
  const automaton::tracematch &tm = initial.get_tracematch();

  for (const shadows::shadow *ss : group) {
    if (&ss->get_tracematch() != &tm ||
        ss->get_container() != initial.get_container()) {
      continue;
    }
    for (auto const &s : g) {
      for (auto const &def : s.get_live().defs()) {
        if (!ss->is_bound_local(def)) {
          continue;
        }
        local_copy_visitor vis;
        s.accept(&vis);
        if (vis.get_rhs()) {
          const cfg::local &rv = *vis.get_rhs();
          res.actual_to_local.erase(def);
          res.actual_to_local.insert({def, rv});
          const std::string &formal = ss->get_var_name_for_local(def);
          res.formal_to_local.erase(formal);
          res.formal_to_local.insert({formal, rv});
          TMOPT_LOG("bindings", tmopt::outs()
                                    << "Bound " << formal << " to " << rv
                                    << " via \"" << s << "\" of " << *ss
                                    << "\n";);
        } else {
          TMOPT_LOG("bindings", tmopt::outs()
                                    << "Cannot resolve binding of " << def
                                    << " at \"" << s << "\" of " << *ss
                                    << "\n";);
          res.unresolved = true;
        }
      }
    }
  }
  return res;
}

} // end namespace analysis
} // end namespace tmopt
