#pragma once

/*
 * Non-relational domain that records, for each register and each
 * initialized memory location, its content (exact or with unknown
 * bits) and its taint as given by the configuration.
 *
 * A register without content is unknown (printed as ?) and a location
 * without taint is untainted.
 */

#include <bincfa/config/analysis_config.hpp>
#include <bincfa/domains/abstract_domain.hpp>
#include <bincfa/types/address.hpp>
#include <bincfa/types/register.hpp>

#include <boost/optional.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/version.hpp>
#include <boost/serialization/optional.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/utility.hpp>
#include <boost/serialization/variant.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace bincfa {
namespace domains {

class value_taint_domain final
    : public abstract_domain_api<value_taint_domain> {
public:
  struct register_cell {
    unsigned size;
    // region pointed to by the register content
    region_t region;
    boost::optional<config::content_t> content;
    boost::optional<config::taint_t> taint;

    template <class Archive> void serialize(Archive &ar, const unsigned int) {
      ar &size;
      ar &region;
      ar &content;
      ar &taint;
    }
  };

  struct memory_cell {
    unsigned nb;
    config::content_t content;
    boost::optional<config::taint_t> taint;

    template <class Archive> void serialize(Archive &ar, const unsigned int) {
      ar &nb;
      ar &content;
      ar &taint;
    }
  };

private:
  // a location is an address and a number of bytes: two initializers
  // at the same address with different lengths are distinct cells
  using location_t = std::pair<address, unsigned>;

  std::map<std::string, register_cell> m_registers;
  std::map<location_t, memory_cell> m_memory;

  friend class boost::serialization::access;

  template <class Archive>
  void serialize(Archive &ar, const unsigned int /*version*/) {
    ar &m_registers;
    ar &m_memory;
  }

public:
  value_taint_domain() {}

  static value_taint_domain init() { return value_taint_domain(); }

  void add_register(const reg &r) override;

  void set_register_from_config(const reg &r, region_t region,
                                const config::init_t &init) override;

  void set_memory_from_config(const address &addr, region_t region,
                              const config::init_t &init,
                              unsigned nb) override;

  std::vector<std::string> to_string() const override;

  bool has_register(const std::string &name) const {
    return m_registers.count(name) > 0;
  }

  const register_cell &get_register(const std::string &name) const;

  // Return none if the nb bytes at addr have not been initialized
  boost::optional<memory_cell> get_memory(const address &addr,
                                          unsigned nb) const;

  bool is_tainted(const std::string &reg_name) const;

  std::size_t num_registers() const { return m_registers.size(); }
  std::size_t num_memory_cells() const { return m_memory.size(); }
};

} // end namespace domains
} // end namespace bincfa
