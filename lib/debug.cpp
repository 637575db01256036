#include <bincfa/support/debug.hpp>

#ifndef NBINCFALOG
namespace bincfa {
bool BincfaLogFlag = false;
std::set<std::string> BincfaLog;

void BincfaEnableLog(std::string x) {
  if (x.empty())
    return;
  BincfaLogFlag = true;
  BincfaLog.insert(x);
}
} // end namespace bincfa
#else
namespace bincfa {
void BincfaEnableLog(std::string x) {}
} // end namespace bincfa
#endif

namespace bincfa {
unsigned BincfaVerbosity = 0;
void BincfaEnableVerbosity(unsigned v) { BincfaVerbosity = v; }

bool BincfaWarningFlag = true;
void BincfaEnableWarningMsg(bool v) { BincfaWarningFlag = v; }
} // end namespace bincfa
