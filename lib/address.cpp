#include <bincfa/support/debug.hpp>
#include <bincfa/types/address.hpp>

#include <boost/functional/hash.hpp>

namespace bincfa {

bincfa_os &operator<<(bincfa_os &o, region_t r) {
  switch (r) {
  case GLOBAL:
    o << "global";
    break;
  case STACK:
    o << "stack";
    break;
  case HEAP:
    o << "heap";
    break;
  default:
    BINCFA_ERROR("unexpected region ", (int)r);
  }
  return o;
}

address::address() : m_region(GLOBAL), m_offset(0), m_size(0) {}

address::address(region_t region, z_number offset, unsigned size)
    : m_region(region), m_offset(std::move(offset)), m_size(size) {
  if (m_offset < z_number(0)) {
    BINCFA_ERROR("negative address ", m_offset);
  }
}

int address::compare(const address &o) const {
  if (m_region != o.m_region) {
    return (m_region < o.m_region) ? -1 : 1;
  }
  if (m_offset < o.m_offset) {
    return -1;
  }
  if (o.m_offset < m_offset) {
    return 1;
  }
  return 0;
}

std::size_t address::hash() const {
  std::size_t seed = 0;
  boost::hash_combine(seed, static_cast<int>(m_region));
  boost::hash_combine(seed, m_offset);
  return seed;
}

std::string address::to_string() const {
  std::string digits = m_offset.get_str(16);
  std::size_t width = m_size / 4;
  if (digits.size() < width) {
    digits.insert(0, width - digits.size(), '0');
  }
  std::string prefix;
  switch (m_region) {
  case STACK:
    prefix = "S";
    break;
  case HEAP:
    prefix = "H";
    break;
  default:;
  }
  return prefix + "0x" + digits;
}

void address::write(bincfa_os &o) const { o << to_string(); }

} // end namespace bincfa
