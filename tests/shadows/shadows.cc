#include "../common.hpp"
#include "../program_options.hpp"

using namespace std;
using namespace tmopt_tests;

/* Tracematches, their state machines and shadows */

static void state_machines(checker &c) {
  has_next_tm a;
  const state_machine &sm = a.tm.get_state_machine();
  tmopt::outs() << a.tm;

  c.expect(sm.num_states() == 3 && sm.num_transitions() == 3,
           "three states and three transitions");
  c.expect(sm.initial_states() == std::vector<const sm_node *>({&a.s0}),
           "s0 is the only initial state");
  c.expect(sm.successors(a.s0, "next") ==
               std::vector<const sm_node *>({&a.s1}),
           "s0 --next--> s1");
  c.expect(sm.successors(a.s0, "hasNext").empty(), "no hasNext edge from s0");
  c.expect(a.tm.has_formal("i") && !a.tm.has_formal("j"), "formals");
  c.expect(a.tm.has_symbol("next") && !a.tm.has_symbol("remove"), "alphabet");

  c.expect_error([&]() { a.tm.new_transition(a.s0, "remove", a.s1); },
                 "symbol outside the alphabet is rejected");
  has_next_tm b;
  c.expect_error([&]() { a.tm.new_transition(a.s0, "next", b.s1); },
                 "transition to another machine is rejected");
  c.expect_error([&]() { sm.successors(b.s0, "next"); },
                 "query with a node of another machine is rejected");
}

static void registry(checker &c) {
  has_next_tm a;
  local_factory lfac;
  local adv = lfac["adv"];
  local other = lfac["other"];
  cfg_t g("main");
  auto &s1 = g.nop("next");
  auto &s2 = g.nop("hasNext");
  g.add_edge(s1, s2);

  shadow_registry reg;
  const shadow &next = reg.add_shadow(s1, a.tm, "main", "next", {{"i", adv}});
  const shadow &has_next = reg.add_shadow(s2, a.tm, "main", "hasNext", {});
  const shadow &foreign = reg.add_shadow(s1, a.tm, "other", "next", {});
  tmopt::outs() << next << "\n";

  c.expect(reg.size() == 3, "three shadows");
  c.expect(next.get_bound_locals() == std::set<local>({adv}), "bound locals");
  c.expect(next.is_bound_local(adv) && !next.is_bound_local(other),
           "is bound local");
  c.expect(next.get_var_name_for_local(adv) == "i", "var name of adv");
  c.expect(next.get_local_for_var("i") && *next.get_local_for_var("i") == adv,
           "local of i");
  c.expect(!has_next.get_local_for_var("i"), "hasNext binds nothing");
  c.expect_error([&]() { next.get_var_name_for_local(other); },
                 "unbound local has no var name");

  auto active = reg.all_active_shadows_for_host(s1, "main");
  c.expect(active.size() == 1 && active[0] == &next,
           "only shadows of main are active in main");
  c.expect(reg.all_active_shadows_for_host(s1, "other").size() == 1,
           "the other procedure sees its own shadow");
  reg.disable(next);
  c.expect(!reg.is_enabled(next) && reg.is_enabled(foreign), "disable");
  c.expect(reg.all_active_shadows_for_host(s1, "main").empty(),
           "disabled shadows are not active");

  shadow_group grp("g");
  grp.add(next);
  grp.add(next);
  grp.add(has_next);
  c.expect(grp.size() == 2 && grp.contains(has_next) && !grp.contains(foreign),
           "group membership");

  c.expect_error(
      [&]() { reg.add_shadow(s1, a.tm, "main", "remove", {}); },
      "shadow symbol outside the alphabet is rejected");
  c.expect_error(
      [&]() { reg.add_shadow(s1, a.tm, "main", "next", {{"j", adv}}); },
      "binding of an unknown formal is rejected");
}

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!tmopt_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }
  checker c;
  state_machines(c);
  registry(c);
  return c.result();
}
