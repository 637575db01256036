#pragma once

/*
 * Semantic effects produced by the instruction decoder. The CFA only
 * stores, prints and persists them: their semantics is given by the
 * transfer functions of the abstract domain.
 */

#include <bincfa/support/os.hpp>

#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>
#include <string>

namespace bincfa {
namespace ir {

enum stmt_code { SET, JMP, JCC, CALL, RETURN, NOP, DIRECTIVE };

class stmt {
  stmt_code m_code;
  // SET: destination; JCC: condition; DIRECTIVE: text
  std::string m_op1;
  // SET: source; JMP, JCC, CALL: target
  std::string m_op2;

  stmt(stmt_code code, std::string op1, std::string op2);

  friend class boost::serialization::access;

  template <class Archive>
  void serialize(Archive &ar, const unsigned int /*version*/) {
    ar &m_code;
    ar &m_op1;
    ar &m_op2;
  }

public:
  // needed by deserialization
  stmt();

  static stmt set(std::string dst, std::string src);
  static stmt jmp(std::string target);
  static stmt jcc(std::string cond, std::string target);
  static stmt call(std::string target);
  static stmt ret();
  static stmt nop();
  static stmt directive(std::string text);

  stmt_code code() const { return m_code; }
  const std::string &lhs() const { return m_op1; }
  const std::string &rhs() const { return m_op2; }

  bool operator==(const stmt &o) const {
    return m_code == o.m_code && m_op1 == o.m_op1 && m_op2 == o.m_op2;
  }

  void write(bincfa_os &o) const;

  friend bincfa_os &operator<<(bincfa_os &o, const stmt &s) {
    s.write(o);
    return o;
  }
};

} // end namespace ir
} // end namespace bincfa
