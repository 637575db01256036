#pragma once

/* Machine registers */

#include <bincfa/support/os.hpp>

#include <boost/optional.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace bincfa {

class register_table;

class reg {
  std::string m_name;
  // width in bits
  unsigned m_size;
  bool m_is_sp;

  reg(std::string name, unsigned size, bool is_sp);
  friend class register_table;

public:
  const std::string &name() const { return m_name; }
  unsigned size() const { return m_size; }
  bool is_stack_pointer() const { return m_is_sp; }

  bool operator==(const reg &o) const { return m_name == o.m_name; }
  bool operator!=(const reg &o) const { return m_name != o.m_name; }
  bool operator<(const reg &o) const { return m_name < o.m_name; }

  void write(bincfa_os &o) const;

  friend bincfa_os &operator<<(bincfa_os &o, const reg &r) {
    r.write(o);
    return o;
  }
};

// The set of registers of the analyzed architecture.
class register_table {
  std::vector<reg> m_regs;
  std::unordered_map<std::string, std::size_t> m_index;

  reg insert(std::string name, unsigned size, bool is_sp);

public:
  register_table() {}

  reg make(const std::string &name, unsigned size);
  // At most one stack pointer can be declared
  reg make_sp(const std::string &name, unsigned size);

  boost::optional<reg> of_name(const std::string &name) const;
  // in declaration order
  const std::vector<reg> &used() const { return m_regs; }
  std::size_t size() const { return m_regs.size(); }

  void write(bincfa_os &o) const;
};

} // end namespace bincfa
