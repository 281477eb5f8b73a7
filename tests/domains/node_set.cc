#include "../common.hpp"
#include "../program_options.hpp"

#include <sstream>

using namespace std;
using namespace tmopt_tests;

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!tmopt_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }
  checker c;
  has_next_tm a;

  node_set_domain bot = node_set_domain::bottom();
  node_set_domain x = mk_set({&a.s0});
  node_set_domain y = mk_set({&a.s1, &a.s2});
  node_set_domain xy = mk_set({&a.s0, &a.s1, &a.s2});

  c.expect(bot.is_bottom() && bot.size() == 0, "bottom is empty");
  c.expect(bot <= x && x <= xy && y <= xy, "inclusion");
  c.expect(!(xy <= x), "strict inclusion");
  c.expect((x | y) == xy, "join is union");
  c.expect((x | x) == x, "join is idempotent");
  c.expect((xy & y) == y, "meet is intersection");
  c.expect((x & y).is_bottom(), "disjoint meet is empty");

  node_set_domain z;
  z += &a.s2;
  z += &a.s2;
  z += a.tm.get_state_machine().initial_states();
  c.expect(z.size() == 2 && z.contain(&a.s0) && z.contain(&a.s2),
           "adding nodes");
  z -= &a.s2;
  c.expect(z == x, "removing nodes");
  z |= y;
  c.expect(z == xy, "in-place join");
  z.clear();
  c.expect(z.is_bottom(), "clear");

  // iteration follows node ids
  std::vector<std::size_t> ids;
  for (auto n : mk_set({&a.s2, &a.s0, &a.s1})) {
    ids.push_back(n->index());
  }
  c.expect(ids == std::vector<std::size_t>({0, 1, 2}), "ordered iteration");

  std::ostringstream ss;
  tmopt_os os(ss);
  os << xy;
  tmopt::outs() << xy << "\n";
  c.expect(ss.str() == "{s0(I),s1,s2(F)}", "printing");

  return c.result();
}
