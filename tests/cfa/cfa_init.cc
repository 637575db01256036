#include "../common.hpp"
#include "../program_options.hpp"

using namespace std;
using namespace bincfa;
using namespace bincfa::config;
using namespace bincfa_tests;

static analysis_config x86_config() {
  analysis_config conf;
  conf.registers().make("eax", 32);
  conf.registers().make("al", 8);
  conf.registers().make_sp("esp", 32);
  return conf;
}

static init_t exact(int64_t v) { return init_t(content{z_number(v)}, boost::none); }

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!bincfa_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  using cfa_initializer::init_abstract_value;

  { // register widths
    analysis_config conf = x86_config();
    conf.set_register_init("al", exact(0x1FF));
    CHECK_ERROR(init_abstract_value<domain_t>(conf),
                "Illegal initialisation for register al");
    conf.set_register_init("al", exact(0xFF));
    domain_t v = init_abstract_value<domain_t>(conf);
    CHECK(v.get_register("al").content);
  }

  { // masks and taints are checked too
    analysis_config conf = x86_config();
    conf.set_register_init("al", init_t(cmask{z_number(1), z_number(0x100)},
                                        boost::none));
    CHECK_ERROR(init_abstract_value<domain_t>(conf),
                "Illegal initialisation for register al");
    conf.set_register_init("al", init_t(content{z_number(1)},
                                        taint_t(taint{z_number(0x100)})));
    CHECK_ERROR(init_abstract_value<domain_t>(conf),
                "Illegal initialisation for register al");
    conf.set_register_init(
        "al", init_t(content{z_number(1)},
                     taint_t(tmask{z_number(0), z_number(0x1FF)})));
    CHECK_ERROR(init_abstract_value<domain_t>(conf),
                "Illegal initialisation for register al");
    conf.set_register_init(
        "al", init_t(content{z_number(1)},
                     taint_t(tmask{z_number(0), z_number(0xFF)})));
    CHECK(init_abstract_value<domain_t>(conf).is_tainted("al"));
  }

  { // byte patterns are only for memory
    analysis_config conf = x86_config();
    conf.set_register_init("eax", init_t(bytes_pattern{"9090"}, boost::none));
    CHECK_ERROR(init_abstract_value<domain_t>(conf),
                "Illegal memory init \"|xx|\" spec used for register eax");
  }

  { // all registers are added, the stack pointer points to the stack
    analysis_config conf = x86_config();
    conf.set_register_init("esp", exact(0x1000));
    conf.set_register_init("eax", exact(0x1000));
    conf.add_memory_init(GLOBAL, z_number(0x1000), 4, exact(0xAB));
    conf.add_memory_init(STACK, z_number(0x1000), 1,
                         init_t(bytes_pattern{"4142"}, boost::none));
    conf.add_memory_init(HEAP, z_number(0x10), 2,
                         init_t(content{z_number(0)},
                                taint_t(taint{z_number(1)})));
    domain_t v = init_abstract_value<domain_t>(conf);
    CHECK(v.num_registers() == 3);
    CHECK(v.get_register("esp").region == STACK);
    CHECK(v.get_register("eax").region == GLOBAL);
    CHECK(!v.get_register("al").content);
    CHECK(v.num_memory_cells() == 3);
    CHECK(v.get_memory(address(GLOBAL, z_number(0x1000), 32), 4));
    CHECK(v.get_memory(address(STACK, z_number(0x1000), 32), 1));
    CHECK(v.get_memory(address(HEAP, z_number(0x10), 32), 2)->nb == 2);
    for (auto const &l : v.to_string()) {
      outs() << l << "\n";
    }
  }

  { // overlapping memory initializers of different lengths
    analysis_config conf = x86_config();
    conf.add_memory_init(GLOBAL, z_number(0x1000), 4, exact(0xAB));
    conf.add_memory_init(GLOBAL, z_number(0x1000), 8, exact(0xCD));
    domain_t v = init_abstract_value<domain_t>(conf);
    CHECK(v.num_memory_cells() == 2);
    CHECK(v.get_memory(address(GLOBAL, z_number(0x1000), 32), 4)->nb == 4);
    CHECK(v.get_memory(address(GLOBAL, z_number(0x1000), 32), 8)->nb == 8);
  }

  { // the root state is built from the configuration
    analysis_config conf = x86_config();
    conf.set_param("analyzer.address_sz", "64");
    conf.set_param("analyzer.operand_sz", "16");
    conf.set_register_init("esp", exact(0x1000));
    cfa_t g;
    state_t &root = g.init_state(address(GLOBAL, z_number(0x400000), 64), conf);
    CHECK(root.id() == 0);
    CHECK(root.ctx().addr_sz == 64 && root.ctx().op_sz == 16);
    CHECK(root.v().num_registers() == 3);
    CHECK(g.size() == 1);
    CHECK(g.copy_state(root).id() == 1);

    // only an empty CFA gets a root
    CHECK_ERROR(g.init_state(address(GLOBAL, z_number(0x400000), 64), conf),
                "already has 2 states");
    CHECK(g.size() == 2);
    CHECK(g.copy_state(root).id() == 2);

    // a failing configuration leaves the CFA empty
    conf.set_register_init("al", exact(0x1FF));
    cfa_t h;
    CHECK_ERROR(h.init_state(address(GLOBAL, z_number(0x400000), 64), conf),
                "register al");
    CHECK(h.size() == 0);
  }

  return bincfa_tests::report();
}
