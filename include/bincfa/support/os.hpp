#pragma once

#include <iosfwd>
#include <sstream>
#include <string>

/* Output streams used by every printable object of the library */

namespace bincfa {

class bincfa_os {
  static bincfa_os *m_cout;
  static bincfa_os *m_cerr;

  std::ostream *m_os;

protected:
  bincfa_os() : m_os(nullptr) {}
  void set_ostream(std::ostream *os) { m_os = os; }

public:
  static bincfa_os *cout();
  static bincfa_os *cerr();

  explicit bincfa_os(std::ostream &os);
  bincfa_os(const bincfa_os &o) = delete;
  bincfa_os &operator=(const bincfa_os &o) = delete;
  virtual ~bincfa_os() {}

  void flush();

  bincfa_os &operator<<(char C);
  bincfa_os &operator<<(unsigned char C);
  bincfa_os &operator<<(signed char C);
  bincfa_os &operator<<(const char *C);
  bincfa_os &operator<<(const std::string &Str);
  bincfa_os &operator<<(unsigned long N);
  bincfa_os &operator<<(long N);
  bincfa_os &operator<<(unsigned long long N);
  bincfa_os &operator<<(long long N);
  bincfa_os &operator<<(const void *P);
  bincfa_os &operator<<(unsigned int N);
  bincfa_os &operator<<(int N);
  bincfa_os &operator<<(double N);
  bincfa_os &operator<<(bool B);
};

// Accumulates everything written into a string
class bincfa_string_os : public bincfa_os {
  std::ostringstream m_string_stream;

public:
  bincfa_string_os();
  ~bincfa_string_os() {}
  std::string str() const;
};

extern bincfa_os &outs();
extern bincfa_os &errs();

} // end namespace bincfa
