#pragma once

/*
 * Global analysis configuration: decoding widths, verbosity, the
 * register set and the initial content (and taint) of registers and
 * memory.
 *
 * Initial contents are given as:
 *
 * - content: an exact value,
 * - cmask: a value whose bits set in the mask are unknown,
 * - bytes_pattern: a raw sequence of bytes written as hexadecimal text.
 *   Only valid for memory.
 *
 * and initial taint as:
 *
 * - taint: an exact taint value,
 * - tmask: a taint value whose bits set in the mask are unknown.
 *
 * No taint means that the domain default applies.
 */

#include <bincfa/numbers/bignums.hpp>
#include <bincfa/support/os.hpp>
#include <bincfa/types/address.hpp>
#include <bincfa/types/register.hpp>

#include <boost/optional.hpp>
#include <boost/serialization/access.hpp>
#include <boost/variant.hpp>
#include <map>
#include <string>
#include <utility>

namespace bincfa {
namespace config {

struct content {
  z_number value;

  template <class Archive> void serialize(Archive &ar, const unsigned int) {
    ar &value;
  }
};

struct cmask {
  z_number value;
  z_number mask;

  template <class Archive> void serialize(Archive &ar, const unsigned int) {
    ar &value;
    ar &mask;
  }
};

struct bytes_pattern {
  std::string bytes;

  template <class Archive> void serialize(Archive &ar, const unsigned int) {
    ar &bytes;
  }
};

struct taint {
  z_number value;

  template <class Archive> void serialize(Archive &ar, const unsigned int) {
    ar &value;
  }
};

struct tmask {
  z_number value;
  z_number mask;

  template <class Archive> void serialize(Archive &ar, const unsigned int) {
    ar &value;
    ar &mask;
  }
};

using content_t = boost::variant<content, cmask, bytes_pattern>;
using taint_t = boost::variant<taint, tmask>;
using init_t = std::pair<content_t, boost::optional<taint_t>>;

bincfa_os &operator<<(bincfa_os &o, const content_t &c);
bincfa_os &operator<<(bincfa_os &o, const taint_t &t);

// (address, number of repetitions of the content)
using memory_key_t = std::pair<z_number, unsigned>;
using memory_table_t = std::map<memory_key_t, init_t>;
using register_content_t = std::map<std::string, init_t>;

class analysis_config {
  unsigned m_address_sz;
  unsigned m_operand_sz;
  unsigned m_loglevel;

  register_table m_registers;
  register_content_t m_register_content;
  memory_table_t m_memory_content;
  memory_table_t m_stack_content;
  memory_table_t m_heap_content;

public:
  analysis_config();

  unsigned address_sz() const { return m_address_sz; }
  unsigned operand_sz() const { return m_operand_sz; }
  unsigned loglevel() const { return m_loglevel; }

  /* Supported parameter strings:

     - analyzer.address_sz: unsigned
     - analyzer.operand_sz: unsigned
     - analyzer.loglevel: unsigned
   */
  void set_param(const std::string &param, const std::string &val);

  register_table &registers() { return m_registers; }
  const register_table &registers() const { return m_registers; }

  // The register must have been declared in registers()
  void set_register_init(const std::string &name, init_t init);
  const register_content_t &register_content() const {
    return m_register_content;
  }

  void add_memory_init(region_t region, z_number addr, unsigned nb,
                       init_t init);
  const memory_table_t &memory_table(region_t region) const;

  void write(bincfa_os &o) const;
};

inline bincfa_os &operator<<(bincfa_os &o, const analysis_config &c) {
  c.write(o);
  return o;
}

} // end namespace config
} // end namespace bincfa
