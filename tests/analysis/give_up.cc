#include "../common.hpp"
#include "../program_options.hpp"

#include <sstream>

using namespace std;
using namespace tmopt_tests;

static void latch(checker &c) {
  give_up_latch l;
  c.expect(!l.is_given_up() && l.reason() == GU_NONE, "latch starts running");
  l.give_up(GU_SIDE_EFFECT);
  l.give_up(GU_FINAL_STATE);
  c.expect(l.is_given_up() && l.reason() == GU_SIDE_EFFECT,
           "first reason is kept");
  c.expect_error([&]() { l.give_up(GU_NONE); }, "give up needs a reason");
}

/*
 *  0: adv = o.f
 *  1: nop next    next(i = adv)   (initial shadow)
 *  2: foo()       may trigger
 *  3: return
 */
static void first_reason_kept(checker &c) {
  has_next_tm a;
  local_factory lfac;
  local adv = lfac["adv"];
  local o = lfac["o"];
  cfg_t g("main");
  auto &s0 = g.assign(adv, value::mk_field_read(o, "f"));
  auto &s1 = g.nop("next");
  auto &s2 = g.invoke("foo", {});
  auto &s3 = g.ret();
  g.add_path({&s0, &s1, &s2, &s3});
  shadow_registry reg;
  const shadow &sh = reg.add_shadow(s1, a.tm, "main", "next", {{"i", adv}});
  shadow_group grp("g");
  grp.add(sh);

  set_side_effect_oracle se;
  se.add(s2);
  shadow_transition_oracle to(reg, "main");
  state_propagator sp(g, grp, sh, reg, se, to);
  tmopt::outs() << sp;

  c.expect(sp.get_give_up_reason() == GU_UNRESOLVED_BINDING,
           "unresolved binding is reported before the side effect");
  c.expect(!sp.is_safely_invariant(), "verdict is false");
  bool all_bottom = true;
  for (auto const &s : g) {
    all_bottom &= sp.get_flow_after(s).is_bottom();
  }
  c.expect(all_bottom, "no flow once given up");
}

static void contract_violations(checker &c) {
  has_next_tm a;
  cfg_t g("main");
  auto &s0 = g.nop("next");
  auto &s1 = g.ret();
  g.add_edge(s0, s1);
  cfg_t other("other");
  auto &t0 = other.nop("next");

  shadow_registry reg;
  const shadow &hosted_elsewhere = reg.add_shadow(t0, a.tm, "main", "next", {});
  const shadow &disabled = reg.add_shadow(s0, a.tm, "main", "next", {});
  reg.disable(disabled);
  const shadow &ok = reg.add_shadow(s0, a.tm, "main", "next", {});
  shadow_group grp("g");
  grp.add(hosted_elsewhere);
  grp.add(disabled);
  grp.add(ok);

  set_side_effect_oracle se;
  identity_transition_oracle to;
  c.expect_error(
      [&]() { state_propagator sp(g, grp, hosted_elsewhere, reg, se, to); },
      "initial shadow hosted in another procedure is rejected");
  c.expect_error([&]() { state_propagator sp(g, grp, disabled, reg, se, to); },
                 "disabled initial shadow is rejected");

  state_propagator sp(g, grp, ok, reg, se, to);
  c.expect(sp.is_safely_invariant(), "enabled initial shadow is analysed");
  c.expect_error([&]() { sp.get_flow_before(t0); },
                 "flow of a foreign statement is rejected");
  c.expect_error([&]() { sp.get_flow_after(t0); },
                 "flow of a foreign statement is rejected");
}

/*
 *  0: nop e       (initial shadow)
 *  1: foo()       may trigger
 */
static void stats_counters(checker &c, bool stats_enabled) {
#ifdef TMOPT_STATS
  has_next_tm a;
  cfg_t g("counted");
  auto &s0 = g.nop("next");
  auto &s1 = g.invoke("foo", {});
  g.add_edge(s0, s1);
  shadow_registry reg;
  const shadow &sh = reg.add_shadow(s0, a.tm, "counted", "next", {});
  shadow_group grp("g");
  grp.add(sh);
  set_side_effect_oracle se;
  se.add(s1);
  identity_transition_oracle to;

  tmopt::TmoptEnableStats(true);
  { state_propagator sp(g, grp, sh, reg, se, to); }
  std::ostringstream buf;
  tmopt_os os(buf);
  tmopt::TmoptStats::Print(os);
  tmopt::TmoptEnableStats(stats_enabled);

  const std::string out = buf.str();
  c.expect(out.find("StatePropagator.analyses: ") != std::string::npos,
           "analyses are counted");
  c.expect(out.find("StatePropagator.gave_up.side_effect: ") !=
               std::string::npos,
           "give up reasons are counted");
  c.expect(out.find("StatePropagator.max_iterations: ") != std::string::npos,
           "iterations are recorded");
  c.expect(out.find("Fixpo: ") != std::string::npos, "fixpoint is timed");
#endif
}

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!tmopt_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }
  checker c;
  latch(c);
  first_reason_kept(c);
  contract_violations(c);
  stats_counters(c, stats_enabled);
  if (stats_enabled) {
    tmopt::TmoptStats::Print(tmopt::outs());
  }
  return c.result();
}
