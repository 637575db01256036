#pragma once

#include <bincfa/config/analysis_config.hpp>
#include <bincfa/support/os.hpp>
#include <bincfa/types/address.hpp>
#include <bincfa/types/register.hpp>

#include <string>
#include <vector>

namespace bincfa {
namespace domains {

/**
 * Abstract domains stored in the CFA must derive from
 * abstract_domain_api (Curiously Recurring Template Pattern).
 *
 * The API only covers what the CFA needs to build and print the
 * initial abstract value. Transfer functions, join and widening are
 * called directly by the analysis driver.
 *
 * Besides the virtual methods, a domain must provide:
 *
 *   - static Dom init(): the value without any register or memory
 *     location,
 *   - a default constructor and a Boost.Serialization serialize
 *     method, both needed to persist the CFA.
 *
 * Updates of distinct registers or memory locations must commute.
 *
 * template<...>
 * class my_domain final: public abstract_domain_api<my_domain<...>> {
 *   static my_domain init() {...}
 *   void add_register(const reg &r) override {...}
 *   ...
 * };
 **/
template <class Dom> class abstract_domain_api {
public:
  using abstract_domain_t = Dom;

  abstract_domain_api() = default;
  virtual ~abstract_domain_api() = default;

  // Add a register with the domain default content and taint
  virtual void add_register(const reg &r) = 0;

  // Set the content (and optionally the taint) of a register. The
  // region is the one pointed to by the register value.
  virtual void set_register_from_config(const reg &r, region_t region,
                                        const config::init_t &init) = 0;

  // Set the content (and optionally the taint) of nb consecutive
  // copies of the content starting at addr.
  virtual void set_memory_from_config(const address &addr, region_t region,
                                      const config::init_t &init,
                                      unsigned nb) = 0;

  // One line per tracked location
  virtual std::vector<std::string> to_string() const = 0;

  void write(bincfa_os &o) const {
    for (auto const &line : to_string()) {
      o << line << "\n";
    }
  }

  friend bincfa_os &operator<<(bincfa_os &o,
                               const abstract_domain_api<Dom> &dom) {
    dom.write(o);
    return o;
  }
};

} // end namespace domains
} // end namespace bincfa
