#pragma once

#include <bincfa/support/os.hpp>

#include <boost/serialization/split_member.hpp>
#include <boost/serialization/string.hpp>
#include <cstdint>
#include <gmp.h>
#include <string>

namespace bincfa {

/* Arbitrary precision integers used for addresses, register and
   memory contents, masks and taint values */
class z_number {
private:
  mpz_t _n;

  friend class boost::serialization::access;

  template <class Archive>
  void save(Archive &ar, const unsigned int /*version*/) const {
    std::string s = get_str(16);
    ar &s;
  }

  template <class Archive>
  void load(Archive &ar, const unsigned int /*version*/) {
    std::string s;
    ar &s;
    *this = z_number(s, 16);
  }

  BOOST_SERIALIZATION_SPLIT_MEMBER()

public:
  z_number();
  z_number(int64_t n);
  // Accepts an optional "0x" prefix when base is 16
  z_number(const std::string &s, unsigned base = 10);

  static z_number from_uint64(uint64_t n);

  z_number(const z_number &o);
  z_number(z_number &&o);
  z_number &operator=(const z_number &o);
  z_number &operator=(z_number &&o);

  ~z_number();

  mpz_srcptr get_mpz_t() const { return _n; }

  std::string get_str(unsigned base = 10) const;

  // Number of digits of the binary representation of the absolute
  // value. Zero is written with one digit.
  unsigned num_bits() const;

  std::size_t hash() const;

  bool is_zero() const;

  bool fits_uint64() const;

  uint64_t to_uint64() const;

  z_number operator+(const z_number &x) const;

  z_number operator-(const z_number &x) const;

  z_number operator&(const z_number &x) const;

  z_number operator|(const z_number &x) const;

  z_number operator<<(unsigned k) const;

  bool operator==(const z_number &x) const;

  bool operator!=(const z_number &x) const;

  bool operator<(const z_number &x) const;

  bool operator<=(const z_number &x) const;

  bool operator>(const z_number &x) const;

  bool operator>=(const z_number &x) const;

  void write(bincfa_os &o) const;

}; // class z_number

inline bincfa_os &operator<<(bincfa_os &o, const z_number &z) {
  z.write(o);
  return o;
}

/** for boost::hash_combine **/
inline std::size_t hash_value(const z_number &z) { return z.hash(); }

} // namespace bincfa

/** for specializations of std::hash **/
namespace std {
template <> struct hash<bincfa::z_number> {
  size_t operator()(const bincfa::z_number &z) const { return z.hash(); }
};
} // namespace std
