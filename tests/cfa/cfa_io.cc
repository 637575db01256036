#include "../common.hpp"
#include "../program_options.hpp"

#include <fstream>
#include <sstream>

using namespace std;
using namespace bincfa;
using namespace bincfa::config;
using namespace bincfa_tests;

static string read_file(const string &path) {
  ifstream ifs(path.c_str());
  stringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

static analysis_config make_config() {
  analysis_config conf;
  conf.registers().make("eax", 32);
  conf.set_register_init(
      "eax", init_t(content{z_number(1)}, taint_t(taint{z_number(0xFF)})));
  conf.add_memory_init(GLOBAL, z_number(0x1000), 4,
                       init_t(cmask{z_number(0xAB), z_number(0xF)}, boost::none));
  return conf;
}

int main(int argc, char **argv) {
  bool stats_enabled = false;
  if (!bincfa_tests::parse_user_options(argc, argv, stats_enabled)) {
    return 0;
  }

  analysis_config conf = make_config();

  { // a marshaled CFA is restored with its states, edges and counter
    cfa_t g;
    state_t &root = g.init_state(global_addr(0x400000), conf);
    for (unsigned i = 1; i <= 5; ++i) {
      state_t &s = g.copy_state(root);
      s.set_ip(global_addr(0x400000 + i));
    }
    g.remove_state(g.get_node(0));
    for (cfa::state_id_t i = 1; i < 5; ++i) {
      g.add_successor(g.get_node(i), g.get_node(i + 1));
    }
    state_t &s3 = g.get_node(3);
    s3.set_final(true);
    s3.set_forward_loop(true);
    s3.set_branch(boost::optional<bool>(true));
    s3.set_bytes({0x74, 0x02});
    s3.set_stmts({ir::stmt::jcc("zf", "0x400007"), ir::stmt::nop()});
    s3.set_tainted(true);
    s3.set_ctx(cfa::decoding_ctx(64, 8));
    CHECK(g.id_allocator().current() == 5);

    string path = tmp_file("cfa.bin");
    cfa::marshal(path, g);
    std::unique_ptr<cfa_t> h = cfa::unmarshal<domain_t>(path);
    std::remove(path.c_str());

    CHECK(h->ids() == g.ids());
    CHECK(h->ids() == vector<cfa::state_id_t>({1, 2, 3, 4, 5}));
    CHECK(h->edges() == g.edges());
    CHECK(h->num_edges() == 4);
    CHECK(h->id_allocator().current() == 5);

    const state_t &r3 = h->get_node(3);
    CHECK(r3.ip() == global_addr(0x400003));
    CHECK(r3.is_final() && r3.forward_loop() && !r3.back_loop());
    CHECK(r3.branch() && *r3.branch());
    CHECK(r3.bytes() == s3.bytes());
    CHECK(r3.stmts() == s3.stmts());
    CHECK(r3.is_tainted());
    CHECK(r3.ctx().addr_sz == 64 && r3.ctx().op_sz == 8);
    CHECK(r3.v().to_string() == s3.v().to_string());
    CHECK(!h->get_node(4).branch());

    // numbering continues after the restored states
    CHECK(h->copy_state(h->get_node(1)).id() == 6);
  }

  { // i/o failures
    cfa_t g;
    CHECK_ERROR(cfa::unmarshal<domain_t>(tmp_file("missing.bin")),
                "cannot open");
    string path = tmp_file("garbage.bin");
    {
      ofstream ofs(path.c_str());
      ofs << "not an archive";
    }
    CHECK_ERROR(cfa::unmarshal<domain_t>(path), "cannot unmarshal");
    {
      ofstream ofs(path.c_str(), ios::out | ios::binary);
      ofs << string(64, '\xff');
    }
    CHECK_ERROR(cfa::unmarshal<domain_t>(path), "cannot unmarshal");

    // a truncated archive
    cfa_t full;
    state_t &root = full.init_state(global_addr(0x400000), conf);
    full.add_successor(root, full.copy_state(root));
    cfa::marshal(path, full);
    string bytes = read_file(path);
    {
      ofstream ofs(path.c_str(), ios::out | ios::binary | ios::trunc);
      ofs << bytes.substr(0, bytes.size() / 2);
    }
    CHECK_ERROR(cfa::unmarshal<domain_t>(path), "cannot unmarshal");

    // a counter that would reissue a stored id
    {
      ofstream ofs(path.c_str(), ios::out | ios::binary | ios::trunc);
      boost::archive::binary_oarchive oa(ofs);
      const state_t s3(3, global_addr(0x400003), domain_t::init(),
                       cfa::decoding_ctx(32, 32));
      std::size_t num_states = 1, num_edges = 0;
      cfa::state_id_t counter = 1;
      oa << num_states << s3 << num_edges << counter;
    }
    CHECK_ERROR(cfa::unmarshal<domain_t>(path), "counter 1 is below state 3");
    std::remove(path.c_str());
    CHECK_ERROR(cfa::marshal("/nonexistent/dir/cfa.bin", g), "cannot open");
  }

  { // text dump
    cfa_t g;
    state_t &root = g.init_state(global_addr(0x400000), conf);
    state_t &s = g.copy_state(root);
    s.set_ip(global_addr(0x400001));
    s.set_bytes({0x90, 0xc3});
    s.set_final(true);
    s.set_tainted(true);
    s.set_stmts({ir::stmt::set("eax", "ebx"), ir::stmt::ret()});
    g.add_successor(root, s);

    const string nodes = "[node = 0]\n"
                         "address = 0x00400000\n"
                         "bytes =\n"
                         "final =false\n"
                         "tainted=false\n"
                         "reg [eax] = 0x1!0xff\n"
                         "mem [0x00001000, 4] = 0xab?0xf\n"
                         "%s"
                         "\n"
                         "[node = 1]\n"
                         "address = 0x00400001\n"
                         "bytes = 90 c3\n"
                         "final =true\n"
                         "tainted=true\n"
                         "reg [eax] = 0x1!0xff\n"
                         "mem [0x00001000, 4] = 0xab?0xf\n"
                         "%s"
                         "\n"
                         "[edges]\n"
                         "e0_1 = 0 -> 1\n";
    string expected_low = nodes;
    expected_low.replace(expected_low.find("%s"), 2, "statements =\n");
    expected_low.replace(expected_low.find("%s"), 2,
                         "statements = eax <- ebx; ret;\n");
    string expected_terse = nodes;
    expected_terse.replace(expected_terse.find("%s"), 2, "");
    expected_terse.replace(expected_terse.find("%s"), 2, "");

    string path = tmp_file("cfa.txt");
    cfa::print(path, g, 0);
    string terse = read_file(path);
    outs() << terse;
    CHECK(terse == expected_terse);

    cfa::print(path, g, 3);
    string verbose = read_file(path);
    outs() << verbose;
    CHECK(verbose == expected_low);
    std::remove(path.c_str());

    bincfa_string_os o;
    o << g;
    CHECK(o.str() == expected_terse);
  }

  return bincfa_tests::report();
}
