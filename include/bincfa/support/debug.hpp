#pragma once

/* Logging, warning and error messages */

#include <bincfa/support/os.hpp>

#include <exception>
#include <utility>
#include <set>
#include <string>

namespace bincfa {

#ifndef NBINCFALOG
#define BINCFA_LOG(TAG, CODE)                                                  \
  do {                                                                         \
    if (::bincfa::BincfaLogFlag && ::bincfa::BincfaLog.count(TAG) > 0) {       \
      CODE;                                                                    \
    }                                                                          \
  } while (0)
extern bool BincfaLogFlag;
extern std::set<std::string> BincfaLog;
void BincfaEnableLog(std::string x);
#else
#define BINCFA_LOG(TAG, CODE)                                                  \
  do {                                                                         \
  } while (0)
void BincfaEnableLog(std::string x);
#endif

extern unsigned BincfaVerbosity;
void BincfaEnableVerbosity(unsigned v);

#define BINCFA_VERBOSE_IF(LEVEL, CODE)                                         \
  do {                                                                         \
    if (::bincfa::BincfaVerbosity >= LEVEL) {                                  \
      CODE;                                                                    \
    }                                                                          \
  } while (0)

extern bool BincfaWarningFlag;
void BincfaEnableWarningMsg(bool v);

// Raised by BINCFA_ERROR. Never caught inside the library.
class bincfa_exception : public std::exception {
  std::string m_msg;

public:
  explicit bincfa_exception(std::string msg) : m_msg(std::move(msg)) {}
  const char *what() const noexcept override { return m_msg.c_str(); }
};

template <typename... ArgTypes>
inline void ___print___(bincfa_os &os, ArgTypes... args) {
  // trick to expand variadic argument pack without recursion
  using expand_variadic_pack = int[];
  // first zero is to prevent empty braced-init-list
  // void() is to prevent overloaded operator, messing things up
  (void)expand_variadic_pack{0, ((os << args), void(), 0)...};
}

#define BINCFA_ERROR(...)                                                      \
  do {                                                                         \
    ::bincfa::bincfa_string_os __bincfa_os__;                                  \
    __bincfa_os__ << "BINCFA ERROR: ";                                         \
    ::bincfa::___print___(__bincfa_os__, __VA_ARGS__);                         \
    throw ::bincfa::bincfa_exception(__bincfa_os__.str());                     \
  } while (0)

#define BINCFA_WARN(...)                                                       \
  do {                                                                         \
    if (::bincfa::BincfaWarningFlag) {                                         \
      ::bincfa::errs() << "BINCFA WARNING: ";                                  \
      ::bincfa::___print___(::bincfa::errs(), __VA_ARGS__);                    \
      ::bincfa::errs() << "\n";                                                \
    }                                                                          \
  } while (0)

} // end namespace bincfa
