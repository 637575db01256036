#pragma once

/* To be included by all the tests */

#include <bincfa/cfa/cfa.hpp>
#include <bincfa/cfa/cfa_io.hpp>
#include <bincfa/config/analysis_config.hpp>
#include <bincfa/domains/value_taint_domain.hpp>
#include <bincfa/numbers/bignums.hpp>
#include <bincfa/support/debug.hpp>
#include <bincfa/support/os.hpp>
#include <bincfa/support/stats.hpp>
#include <bincfa/types/address.hpp>
#include <bincfa/types/register.hpp>

#include <cstdio>
#include <string>

namespace bincfa_tests {

using domain_t = bincfa::domains::value_taint_domain;
using cfa_t = bincfa::cfa::cfa<domain_t>;
using state_t = cfa_t::state_t;

inline unsigned &num_failures() {
  static unsigned n = 0;
  return n;
}

inline void check(bool cond, const char *what, const char *file, int line) {
  if (cond) {
    bincfa::outs() << "OK: " << what << "\n";
  } else {
    ++num_failures();
    bincfa::outs() << "FAIL: " << what << " (" << file << ":" << line << ")\n";
  }
}

// Run f and check that it raises a bincfa_exception whose message
// contains msg.
template <typename F>
void check_error(F f, const std::string &msg, const char *what,
                 const char *file, int line) {
  bool raised = false;
  std::string text;
  try {
    f();
  } catch (bincfa::bincfa_exception &e) {
    raised = true;
    text = e.what();
  }
  if (raised) {
    bincfa::outs() << "  raised: " << text << "\n";
  }
  check(raised && text.find(msg) != std::string::npos, what, file, line);
}

inline int report() {
  if (num_failures() > 0) {
    bincfa::outs() << num_failures() << " check(s) failed\n";
    return 1;
  }
  return 0;
}

inline bincfa::address global_addr(uint64_t off, unsigned size = 32) {
  return bincfa::address(bincfa::GLOBAL, bincfa::z_number::from_uint64(off),
                         size);
}

// A file name in the working directory of the test
inline std::string tmp_file(const std::string &name) {
  return std::string("bincfa_test_") + name;
}

} // namespace bincfa_tests

#define CHECK(COND)                                                            \
  ::bincfa_tests::check(static_cast<bool>(COND), #COND, __FILE__, __LINE__)
#define CHECK_ERROR(CODE, MSG)                                                 \
  ::bincfa_tests::check_error([&]() { CODE; }, MSG, #CODE, __FILE__, __LINE__)
