#include <bincfa/numbers/bignums.hpp>
#include <bincfa/support/debug.hpp>

#include <boost/functional/hash.hpp>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

namespace bincfa {
namespace bignums_impl {
struct scoped_cstring {
  typedef void (*__gmp_freefunc_t)(void *, size_t);
  char *m_str;
  scoped_cstring(char *s) { m_str = s; }
  ~scoped_cstring() {
    __gmp_freefunc_t freefunc;
    mp_get_memory_functions(nullptr, nullptr, &freefunc);
    (*freefunc)(m_str, std::strlen(m_str) + 1);
  }
};
} // namespace bignums_impl

z_number::z_number() { mpz_init(_n); }

z_number::z_number(int64_t n) {
  if (n >= std::numeric_limits<signed long int>::min() &&
      n <= std::numeric_limits<signed long int>::max()) {
    mpz_init_set_si(_n, static_cast<signed long int>(n));
  } else {
    mpz_init(_n);
    mpz_import(_n, 1, 1, sizeof(int64_t), 0, 0, &n);
    if (n < 0) {
      mpz_neg(_n, _n);
    }
  }
}

z_number z_number::from_uint64(uint64_t n) {
  z_number r;
  if (n <= std::numeric_limits<unsigned long>::max()) {
    mpz_set_ui(r._n, static_cast<unsigned long>(n));
  } else {
    mpz_import(r._n, 1, 1, sizeof(uint64_t), 0, 0, &n);
  }
  return r;
}

z_number::z_number(const std::string &s, unsigned base) {
  std::string digits(s);
  if (base == 16 && digits.size() > 2 && digits[0] == '0' &&
      (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
  }
  int res = mpz_init_set_str(_n, digits.c_str(), base);
  if (res == -1) {
    mpz_clear(_n);
    BINCFA_ERROR("z_number: unexpected string \"", s, "\" in base ", base);
  }
}

z_number::z_number(const z_number &o) { mpz_init_set(_n, o._n); }

z_number::z_number(z_number &&o) {
  mpz_init(_n);
  mpz_swap(_n, o._n);
}

z_number &z_number::operator=(const z_number &o) {
  if (this != &o) {
    mpz_set(_n, o._n);
  }
  return *this;
}

z_number &z_number::operator=(z_number &&o) {
  if (this != &o) {
    mpz_swap(_n, o._n);
  }
  return *this;
}

z_number::~z_number() { mpz_clear(_n); }

std::string z_number::get_str(unsigned base) const {
  bignums_impl::scoped_cstring res(mpz_get_str(0, base, _n));
  return std::string(res.m_str);
}

unsigned z_number::num_bits() const {
  return static_cast<unsigned>(mpz_sizeinbase(_n, 2));
}

std::size_t z_number::hash() const {
  std::size_t seed = 0;
  boost::hash_combine(seed, mpz_sgn(_n));
  const mp_limb_t *limbs = _n->_mp_d;
  for (int i = 0, e = std::abs(_n->_mp_size); i < e; ++i) {
    boost::hash_combine(seed, limbs[i]);
  }
  return seed;
}

bool z_number::is_zero() const { return mpz_sgn(_n) == 0; }

bool z_number::fits_uint64() const {
  return mpz_sgn(_n) >= 0 && mpz_sizeinbase(_n, 2) <= 64;
}

uint64_t z_number::to_uint64() const {
  if (!fits_uint64()) {
    BINCFA_ERROR("z_number ", get_str(), " does not fit into uint64_t");
  }
  uint64_t res = 0;
  mpz_export(&res, nullptr, -1, sizeof(uint64_t), 0, 0, _n);
  return res;
}

z_number z_number::operator+(const z_number &x) const {
  z_number r;
  mpz_add(r._n, _n, x._n);
  return r;
}

z_number z_number::operator-(const z_number &x) const {
  z_number r;
  mpz_sub(r._n, _n, x._n);
  return r;
}

z_number z_number::operator&(const z_number &x) const {
  z_number r;
  mpz_and(r._n, _n, x._n);
  return r;
}

z_number z_number::operator|(const z_number &x) const {
  z_number r;
  mpz_ior(r._n, _n, x._n);
  return r;
}

z_number z_number::operator<<(unsigned k) const {
  z_number r;
  mpz_mul_2exp(r._n, _n, k);
  return r;
}

bool z_number::operator==(const z_number &x) const {
  return mpz_cmp(_n, x._n) == 0;
}

bool z_number::operator!=(const z_number &x) const {
  return mpz_cmp(_n, x._n) != 0;
}

bool z_number::operator<(const z_number &x) const {
  return mpz_cmp(_n, x._n) < 0;
}

bool z_number::operator<=(const z_number &x) const {
  return mpz_cmp(_n, x._n) <= 0;
}

bool z_number::operator>(const z_number &x) const {
  return mpz_cmp(_n, x._n) > 0;
}

bool z_number::operator>=(const z_number &x) const {
  return mpz_cmp(_n, x._n) >= 0;
}

void z_number::write(bincfa_os &o) const { o << get_str(); }

} // namespace bincfa
