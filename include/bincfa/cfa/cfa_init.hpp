#pragma once

/*
 * Build the initial abstract value of the analysis from the
 * configuration.
 *
 * The register widths are checked against the configured contents
 * and taints. A misconfigured register makes the whole analysis
 * meaningless so it raises an error which is never caught here.
 */

#include <bincfa/config/analysis_config.hpp>
#include <bincfa/numbers/bignums.hpp>
#include <bincfa/support/debug.hpp>
#include <bincfa/support/stats.hpp>
#include <bincfa/types/address.hpp>
#include <bincfa/types/register.hpp>

#include <boost/variant/static_visitor.hpp>

namespace bincfa {
namespace cfa_initializer {

namespace cfa_initializer_impl {

// Check that values and masks fit in a register of m_size bits
class check_width : public boost::static_visitor<void> {
  const reg &m_reg;

  void check(const z_number &n) const {
    if (n.num_bits() > m_reg.size()) {
      BINCFA_ERROR("Illegal initialisation for register ", m_reg.name());
    }
  }

public:
  explicit check_width(const reg &r) : m_reg(r) {}

  void operator()(const config::content &c) const { check(c.value); }
  void operator()(const config::cmask &c) const {
    check(c.value);
    check(c.mask);
  }
  void operator()(const config::bytes_pattern &) const {
    BINCFA_ERROR("Illegal memory init \"|xx|\" spec used for register ",
                 m_reg.name());
  }
  void operator()(const config::taint &t) const { check(t.value); }
  void operator()(const config::tmask &t) const {
    check(t.value);
    check(t.mask);
  }
};

inline void check_register_init(const reg &r, const config::init_t &init) {
  check_width vis(r);
  boost::apply_visitor(vis, init.first);
  if (init.second) {
    boost::apply_visitor(vis, *init.second);
  }
}

template <class Domain>
void fold_memory(Domain &v, region_t region,
                 const config::analysis_config &conf) {
  for (auto const &kv : conf.memory_table(region)) {
    address addr(region, kv.first.first, conf.address_sz());
    BINCFA_LOG("cfa-init", outs() << "init " << addr << " (" << kv.first.second
                                  << " times)\n";);
    v.set_memory_from_config(addr, region, kv.second, kv.first.second);
  }
}
} // end namespace cfa_initializer_impl

/*
 * The configuration tables are ordered maps so registers are folded
 * by name and memory locations by (address, length).
 */
template <class Domain>
Domain init_abstract_value(const config::analysis_config &conf) {
  BINCFA_SCOPED_STATS("CFA.init", 1);
  Domain v = Domain::init();
  for (auto const &r : conf.registers().used()) {
    v.add_register(r);
  }

  for (auto const &kv : conf.register_content()) {
    boost::optional<reg> r = conf.registers().of_name(kv.first);
    if (!r) {
      BINCFA_ERROR("initial content given for unknown register ", kv.first);
    }
    cfa_initializer_impl::check_register_init(*r, kv.second);
    region_t region = r->is_stack_pointer() ? STACK : GLOBAL;
    BINCFA_LOG("cfa-init", outs() << "init register " << r->name() << " in "
                                  << region << "\n";);
    v.set_register_from_config(*r, region, kv.second);
  }

  cfa_initializer_impl::fold_memory(v, GLOBAL, conf);
  cfa_initializer_impl::fold_memory(v, STACK, conf);
  cfa_initializer_impl::fold_memory(v, HEAP, conf);
  return v;
}

} // end namespace cfa_initializer
} // end namespace bincfa
