#include <bincfa/support/debug.hpp>
#include <bincfa/types/register.hpp>

#include <utility>

namespace bincfa {

reg::reg(std::string name, unsigned size, bool is_sp)
    : m_name(std::move(name)), m_size(size), m_is_sp(is_sp) {}

void reg::write(bincfa_os &o) const { o << m_name; }

reg register_table::insert(std::string name, unsigned size,
                            bool is_sp) {
  if (size == 0) {
    BINCFA_ERROR("register ", name, " cannot have width zero");
  }
  if (m_index.count(name) > 0) {
    BINCFA_ERROR("register ", name, " is already declared");
  }
  m_index.insert({name, m_regs.size()});
  m_regs.push_back(reg(std::move(name), size, is_sp));
  return m_regs.back();
}

reg register_table::make(const std::string &name, unsigned size) {
  return insert(name, size, false);
}

reg register_table::make_sp(const std::string &name, unsigned size) {
  for (auto const &r : m_regs) {
    if (r.is_stack_pointer()) {
      BINCFA_ERROR("stack pointer already declared as ", r.name());
    }
  }
  return insert(name, size, true);
}

boost::optional<reg> register_table::of_name(const std::string &name) const {
  auto it = m_index.find(name);
  if (it == m_index.end()) {
    return boost::none;
  }
  return m_regs[it->second];
}

void register_table::write(bincfa_os &o) const {
  o << "registers:";
  for (auto const &r : m_regs) {
    o << " " << r.name() << "(" << r.size();
    if (r.is_stack_pointer()) {
      o << ",sp";
    }
    o << ")";
  }
  o << "\n";
}

} // end namespace bincfa
