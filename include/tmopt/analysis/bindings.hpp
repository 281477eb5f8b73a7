#pragma once

/*
 * Bindings between the free variables of a tracematch and the locals
 * of the analysed procedure.
 *
 * The weaver copies every local that realizes a tracematch variable
 * into an advice local right before the shadow (adviceLocal = x).
 * Scanning those copies tells us which trace local each formal is
 * bound to:
 *
 *   formal_to_local: tracematch formal -> trace local (x)
 *   actual_to_local: advice local -> trace local (x)
 *
 * If a bound advice local is assigned anything but a plain local we
 * cannot tell which object the shadow refers to and the extraction
 * fails.
 */

#include <tmopt/cfg/cfg.hpp>
#include <tmopt/cfg/local.hpp>
#include <tmopt/shadows/shadow.hpp>
#include <tmopt/support/os.hpp>

#include <map>
#include <string>

namespace tmopt {
namespace analysis {

using formal_to_local_map_t = std::map<std::string, cfg::local>;
using actual_to_local_map_t = std::map<cfg::local, cfg::local>;

struct binding_maps {
  formal_to_local_map_t formal_to_local;
  actual_to_local_map_t actual_to_local;
  // some bound advice local is not assigned from a plain local
  bool unresolved;

  binding_maps() : unresolved(false) {}

  // Return true if l is the target of some advice local
  bool is_trace_local(const cfg::local &l) const;

  void write(tmopt_os &o) const;

  friend tmopt_os &operator<<(tmopt_os &o, const binding_maps &b) {
    b.write(o);
    return o;
  }
};

// Scan g for the assignments to the locals bound by the shadows of
// group that share the tracematch and the procedure of initial.
binding_maps extract_bindings(const cfg::cfg &g,
                              const shadows::shadow_group &group,
                              const shadows::shadow &initial);

} // end namespace analysis
} // end namespace tmopt
