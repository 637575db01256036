#pragma once

/* Addresses of the analyzed binary, partitioned into regions */

#include <bincfa/numbers/bignums.hpp>
#include <bincfa/support/os.hpp>

#include <boost/serialization/access.hpp>
#include <string>

namespace bincfa {

enum region_t { GLOBAL, STACK, HEAP };

bincfa_os &operator<<(bincfa_os &o, region_t r);

class address {
  region_t m_region;
  z_number m_offset;
  // size in bits
  unsigned m_size;

  friend class boost::serialization::access;

  template <class Archive>
  void serialize(Archive &ar, const unsigned int /*version*/) {
    ar &m_region;
    ar &m_offset;
    ar &m_size;
  }

public:
  address();
  address(region_t region, z_number offset, unsigned size);

  static address of_int(region_t region, const z_number &offset,
                        unsigned size) {
    return address(region, offset, size);
  }

  region_t region() const { return m_region; }
  const z_number &offset() const { return m_offset; }
  unsigned size() const { return m_size; }

  // Regions are compared first
  int compare(const address &o) const;

  bool operator==(const address &o) const { return compare(o) == 0; }
  bool operator!=(const address &o) const { return compare(o) != 0; }
  bool operator<(const address &o) const { return compare(o) < 0; }

  std::size_t hash() const;

  std::string to_string() const;

  void write(bincfa_os &o) const;

  friend bincfa_os &operator<<(bincfa_os &o, const address &a) {
    a.write(o);
    return o;
  }
};

inline std::size_t hash_value(const address &a) { return a.hash(); }

} // end namespace bincfa
