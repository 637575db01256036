#include "../common.hpp"
#include "../program_options.hpp"

#include <set>
#include <unordered_set>

using namespace std;
using namespace bincfa;
using namespace bincfa::cfa;
using namespace bincfa_tests;

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!bincfa_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  { // the allocator never reuses an id
    state_id_allocator alloc;
    CHECK(alloc.current() == root_state_id);
    CHECK(alloc.fresh() == 1);
    CHECK(alloc.fresh() == 2);
    CHECK(alloc.current() == 2);
    alloc.reset(5);
    CHECK(alloc.fresh() == 6);
    alloc.observe(3);
    CHECK(alloc.current() == 6);
    alloc.observe(10);
    CHECK(alloc.fresh() == 11);
  }

  config::analysis_config conf;
  cfa_t g;
  state_t &root = g.init_state(global_addr(0x400000), conf);
  CHECK(root.id() == root_state_id);
  CHECK(!root.is_final() && !root.back_loop() && !root.forward_loop());
  CHECK(!root.branch());
  CHECK(root.stmts().empty() && root.bytes().empty());
  CHECK(!root.is_tainted());
  CHECK(root.ctx().addr_sz == 32 && root.ctx().op_sz == 32);

  { // ids are distinct and increase in creation order
    vector<state_id_t> ids;
    ids.push_back(root.id());
    for (unsigned i = 0; i < 10; ++i) {
      ids.push_back(g.copy_state(root).id());
    }
    bool increasing = true;
    for (unsigned i = 1; i < ids.size(); ++i) {
      increasing &= ids[i - 1] < ids[i];
    }
    CHECK(increasing);
    CHECK(ids.front() == 0 && ids.back() == 10);
    CHECK(g.size() == 11);
  }

  { // identity only depends on the id
    state_t &a = g.get_node(1);
    state_t &b = g.get_node(2);
    CHECK(a != b);
    CHECK(a.ip() == b.ip());
    state_t a_copy(a);
    a_copy.set_final(true);
    a_copy.set_ip(global_addr(0x500000));
    a_copy.stmts().push_back(ir::stmt::ret());
    CHECK(a_copy == a);
    CHECK(a_copy.hash() == a.hash());
    CHECK(std::hash<state_t>()(a_copy) == std::hash<state_t>()(a));
    CHECK(a < b);

    // mutation in place does not affect set membership
    std::set<state_t> ordered = {a, b};
    std::unordered_set<state_t> hashed = {a, b};
    a.set_tainted(true);
    a.set_branch(boost::optional<bool>(false));
    a.set_bytes({0x90, 0xc3});
    CHECK(ordered.count(a) == 1);
    CHECK(hashed.count(a) == 1);
    CHECK(g.get_node(1).is_tainted());
    CHECK(g.get_node(1).branch() && !*g.get_node(1).branch());
  }

  { // a copy keeps the content but not the identity
    state_t &a = g.get_node(1);
    a.set_stmts({ir::stmt::set("eax", "ebx"), ir::stmt::ret()});
    a.set_back_loop(true);
    state_t &c = g.copy_state(a);
    CHECK(c != a);
    CHECK(c.id() == 11);
    CHECK(c.ip() == a.ip());
    CHECK(c.stmts().size() == 2 && c.stmts()[0] == ir::stmt::set("eax", "ebx"));
    CHECK(c.back_loop() && c.is_tainted());
    CHECK(c.bytes() == a.bytes());
    CHECK(c.in_degree() == 0 && c.out_degree() == 0);
  }

  return bincfa_tests::report();
}
