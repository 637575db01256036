#include <bincfa/ir/stmt.hpp>
#include <bincfa/support/debug.hpp>

#include <utility>

namespace bincfa {
namespace ir {

stmt::stmt() : m_code(NOP) {}

stmt::stmt(stmt_code code, std::string op1, std::string op2)
    : m_code(code), m_op1(std::move(op1)), m_op2(std::move(op2)) {}

stmt stmt::set(std::string dst, std::string src) {
  return stmt(SET, std::move(dst), std::move(src));
}

stmt stmt::jmp(std::string target) { return stmt(JMP, "", std::move(target)); }

stmt stmt::jcc(std::string cond, std::string target) {
  return stmt(JCC, std::move(cond), std::move(target));
}

stmt stmt::call(std::string target) {
  return stmt(CALL, "", std::move(target));
}

stmt stmt::ret() { return stmt(RETURN, "", ""); }

stmt stmt::nop() { return stmt(NOP, "", ""); }

stmt stmt::directive(std::string text) {
  return stmt(DIRECTIVE, std::move(text), "");
}

void stmt::write(bincfa_os &o) const {
  switch (m_code) {
  case SET:
    o << m_op1 << " <- " << m_op2 << ";";
    break;
  case JMP:
    o << "jmp " << m_op2 << ";";
    break;
  case JCC:
    o << "if (" << m_op1 << ") jmp " << m_op2 << ";";
    break;
  case CALL:
    o << "call " << m_op2 << ";";
    break;
  case RETURN:
    o << "ret;";
    break;
  case NOP:
    o << "nop;";
    break;
  case DIRECTIVE:
    o << "directive " << m_op1 << ";";
    break;
  default:
    BINCFA_ERROR("unexpected statement code ", (int)m_code);
  }
}

} // end namespace ir
} // end namespace bincfa
