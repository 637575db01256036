#include <bincfa/support/os.hpp>

#include <iostream>

namespace bincfa {

bincfa_os &outs() { return *bincfa_os::cout(); }
bincfa_os &errs() { return *bincfa_os::cerr(); }

bincfa_os *bincfa_os::m_cout = nullptr;
bincfa_os *bincfa_os::m_cerr = nullptr;

bincfa_os::bincfa_os(std::ostream &os) : m_os(&os) {}

// The two standard streams live until the process ends.
bincfa_os *bincfa_os::cout() {
  if (!m_cout)
    m_cout = new bincfa_os(std::cout);
  return m_cout;
}

bincfa_os *bincfa_os::cerr() {
  if (!m_cerr)
    m_cerr = new bincfa_os(std::cerr);
  return m_cerr;
}

void bincfa_os::flush() { m_os->flush(); }

bincfa_os &bincfa_os::operator<<(char C) {
  *m_os << C;
  return *this;
}

bincfa_os &bincfa_os::operator<<(unsigned char C) {
  *m_os << C;
  return *this;
}

bincfa_os &bincfa_os::operator<<(signed char C) {
  *m_os << C;
  return *this;
}

bincfa_os &bincfa_os::operator<<(const char *C) {
  *m_os << C;
  return *this;
}

bincfa_os &bincfa_os::operator<<(const std::string &Str) {
  *m_os << Str;
  return *this;
}

bincfa_os &bincfa_os::operator<<(unsigned long N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(long N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(unsigned long long N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(long long N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(const void *P) {
  *m_os << P;
  return *this;
}

bincfa_os &bincfa_os::operator<<(unsigned int N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(int N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(double N) {
  *m_os << N;
  return *this;
}

bincfa_os &bincfa_os::operator<<(bool B) {
  *m_os << (B ? "true" : "false");
  return *this;
}

bincfa_string_os::bincfa_string_os() : bincfa_os() {
  set_ostream(&m_string_stream);
}

std::string bincfa_string_os::str() const { return m_string_stream.str(); }

} // end namespace bincfa
