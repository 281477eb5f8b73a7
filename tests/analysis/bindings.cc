#include "../common.hpp"
#include "../program_options.hpp"

using namespace std;
using namespace tmopt_tests;

/*
 * Iterator protocol checked with the HasNext tracematch. The weaver
 * copies the iterator into a fresh advice local right before each
 * shadow:
 *
 *   0: it = c.iterator()
 *   1: adv1 = it
 *   2: nop next          next(i = adv1)     (initial shadow)
 *   3: adv2 = it
 *   4: nop hasNext       hasNext(i = adv2)
 *   5: return
 */
struct iterator_prog {
  has_next_tm a;
  local_factory lfac;
  local c;
  local it;
  local adv1;
  local adv2;
  cfg_t g;
  shadow_registry reg;
  shadow_group grp;
  const shadow *next_sh;
  const shadow *has_next_sh;

  iterator_prog(bool redefine)
      : c(lfac["c"]), it(lfac["it"]), adv1(lfac["adv1"]), adv2(lfac["adv2"]),
        g("iterate"), grp("iterate") {
    auto &s0 = g.assign(it, value::mk_invoke("iterator", {c}));
    auto &s1 = g.assign(adv1, it);
    auto &s2 = g.nop("next");
    auto &s3 = g.assign(adv2, it);
    auto &s4 = g.nop("hasNext");
    auto &s5 = g.ret();
    if (redefine) {
      auto &s6 = g.assign(it, value::mk_invoke("iterator", {c}));
      g.add_path({&s0, &s1, &s2, &s6, &s3, &s4, &s5});
    } else {
      g.add_path({&s0, &s1, &s2, &s3, &s4, &s5});
    }
    next_sh = &reg.add_shadow(s2, a.tm, "iterate", "next", {{"i", adv1}});
    has_next_sh =
        &reg.add_shadow(s4, a.tm, "iterate", "hasNext", {{"i", adv2}});
    grp.add(*next_sh);
    grp.add(*has_next_sh);
  }
};

static void extraction(checker &c) {
  iterator_prog p(false);
  binding_maps b = extract_bindings(p.g, p.grp, *p.next_sh);
  tmopt::outs() << b << "\n";

  c.expect(!b.unresolved, "plain copies are resolved");
  c.expect(b.formal_to_local.size() == 1 && b.formal_to_local.at("i") == p.it,
           "formal i is bound to it");
  c.expect(b.actual_to_local.size() == 2 && b.actual_to_local.at(p.adv1) == p.it &&
               b.actual_to_local.at(p.adv2) == p.it,
           "both advice locals point to it");
  c.expect(b.is_trace_local(p.it), "it is a trace local");
  c.expect(!b.is_trace_local(p.adv1), "advice locals are not trace locals");
}

static void protocol_respected(checker &c) {
  iterator_prog p(false);
  set_side_effect_oracle se;
  shadow_transition_oracle to(p.reg, "iterate");
  state_propagator sp(p.g, p.grp, *p.next_sh, p.reg, se, to);
  tmopt::outs() << p.g << sp;

  c.expect(sp.get_flow_before(p.g.at(0)).is_bottom(),
           "nothing is tracked before the initial shadow");
  c.expect(sp.get_flow_after(p.g.at(2)) == mk_set({&p.a.s1}), "next moves to s1");
  c.expect(sp.get_flow_after(p.g.at(4)) == mk_set({&p.a.s0}),
           "hasNext moves back to s0");
  c.expect(sp.is_safely_invariant(), "next then hasNext is invariant");
}

static void redefinition(checker &c) {
  iterator_prog p(true);
  set_side_effect_oracle se;
  shadow_transition_oracle to(p.reg, "iterate");
  state_propagator sp(p.g, p.grp, *p.next_sh, p.reg, se, to);
  tmopt::outs() << p.g << sp;

  c.expect(sp.get_give_up_reason() == GU_REDEFINED_BINDING,
           "redefining it after the initial shadow gives up");
  c.expect(!sp.is_safely_invariant(), "redefinition is not invariant");
}

static void final_through_shadows(checker &c) {
  // next; next
  has_next_tm a;
  local_factory lfac;
  local it = lfac["it"];
  local adv1 = lfac["adv1"];
  local adv2 = lfac["adv2"];
  cfg_t g("twice");
  auto &s0 = g.assign(adv1, it);
  auto &s1 = g.nop("next");
  auto &s2 = g.assign(adv2, it);
  auto &s3 = g.nop("next");
  auto &s4 = g.ret();
  g.add_path({&s0, &s1, &s2, &s3, &s4});
  shadow_registry reg;
  const shadow &sh1 = reg.add_shadow(s1, a.tm, "twice", "next", {{"i", adv1}});
  const shadow &sh2 = reg.add_shadow(s3, a.tm, "twice", "next", {{"i", adv2}});
  shadow_group grp("twice");
  grp.add(sh1);
  grp.add(sh2);

  set_side_effect_oracle se;
  shadow_transition_oracle to(reg, "twice");
  state_propagator sp(g, grp, sh1, reg, se, to);
  tmopt::outs() << g << sp;

  c.expect(sp.get_give_up_reason() == GU_FINAL_STATE,
           "second next reaches the final node");
  c.expect(!sp.is_safely_invariant(), "next twice is not invariant");
}

static void unrelated_shadows(checker &c) {
  // Shadows of other tracematches or other procedures do not take
  // part in the extraction, even if their locals are not resolvable.
  iterator_prog p(false);
  local o = p.lfac["o"];
  local x = p.lfac["x"];
  auto &s = p.g.assign(x, value::mk_field_read(o, "f"));
  p.g.add_edge(p.g.at(5), s);

  tracematch other("Other", {"v"}, {"e"});
  other.new_state(true, false);
  const shadow &other_tm =
      p.reg.add_shadow(s, other, "iterate", "e", {{"v", x}});
  const shadow &other_method =
      p.reg.add_shadow(s, p.a.tm, "elsewhere", "next", {{"i", x}});
  p.grp.add(other_tm);
  p.grp.add(other_method);

  binding_maps b = extract_bindings(p.g, p.grp, *p.next_sh);
  tmopt::outs() << b << "\n";
  c.expect(!b.unresolved, "unrelated shadows are ignored");
  c.expect(b.actual_to_local.count(x) == 0, "x is not recorded");

  set_side_effect_oracle se;
  shadow_transition_oracle to(p.reg, "iterate");
  state_propagator sp(p.g, p.grp, *p.next_sh, p.reg, se, to);
  tmopt::outs() << sp;
  c.expect(!sp.gave_up(), "no give up with unrelated shadows");
}

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!tmopt_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }
  checker c;
  extraction(c);
  protocol_respected(c);
  redefinition(c);
  final_through_shadows(c);
  unrelated_shadows(c);
  if (stats_enabled) {
    tmopt::TmoptStats::Print(tmopt::outs());
  }
  return c.result();
}
