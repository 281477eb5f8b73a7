#include <tmopt/support/debug.hpp>

#ifndef NTMOPTLOG
namespace tmopt {
bool TmoptLogFlag = false;
std::set<std::string> TmoptLog;

void TmoptEnableLog(std::string x) {
  if (x.empty())
    return;
  TmoptLogFlag = true;
  TmoptLog.insert(x);
}
} // end namespace tmopt
#else
namespace tmopt {
void TmoptEnableLog(std::string x) {}
} // end namespace tmopt
#endif

namespace tmopt {
unsigned TmoptVerbosity = 0;
void TmoptEnableVerbosity(unsigned v) { TmoptVerbosity = v; }

bool TmoptWarningFlag = true;
void TmoptEnableWarningMsg(bool v) { TmoptWarningFlag = v; }
} // end namespace tmopt
