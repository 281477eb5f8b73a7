#pragma once

/* Logging, warnings and error messages */

#include <tmopt/config.h>
#include <tmopt/support/os.hpp>

#include <exception>
#include <set>
#include <sstream>
#include <string>

namespace tmopt {

#ifndef NTMOPTLOG
#define TMOPT_LOG(TAG, CODE)                                                   \
  do {                                                                         \
    if (::tmopt::TmoptLogFlag && ::tmopt::TmoptLog.count(TAG) > 0) {           \
      CODE;                                                                    \
    }                                                                          \
  } while (0)
extern bool TmoptLogFlag;
extern std::set<std::string> TmoptLog;
void TmoptEnableLog(std::string x);
#else
#define TMOPT_LOG(TAG, CODE)                                                   \
  do {                                                                         \
  } while (0)
void TmoptEnableLog(std::string x);
#endif

extern unsigned TmoptVerbosity;
void TmoptEnableVerbosity(unsigned v);
#define TMOPT_VERBOSE_IF(LEVEL, CODE)                                          \
  do {                                                                         \
    if (::tmopt::TmoptVerbosity >= LEVEL) {                                    \
      CODE;                                                                    \
    }                                                                          \
  } while (0)

extern bool TmoptWarningFlag;
void TmoptEnableWarningMsg(bool b);

// Raised on violations of the library's preconditions. Analysis
// outcomes are never reported through exceptions.
class tmopt_exception : public std::exception {
  std::string m_msg;

public:
  tmopt_exception(const std::string &msg) : m_msg(msg) {}
  virtual const char *what() const noexcept override { return m_msg.c_str(); }
};

inline void ___print___(tmopt_os &os) {}

template <typename T, typename... ArgTypes>
inline void ___print___(tmopt_os &os, const T &head, const ArgTypes &... tail) {
  os << head;
  ___print___(os, tail...);
}

#define TMOPT_ERROR(...)                                                       \
  do {                                                                         \
    std::ostringstream __ss__;                                                 \
    ::tmopt::tmopt_os __os__(__ss__);                                          \
    __os__ << "TMOPT ERROR: ";                                                 \
    ::tmopt::___print___(__os__, __VA_ARGS__);                                 \
    throw ::tmopt::tmopt_exception(__ss__.str());                              \
  } while (0)

#define TMOPT_WARN(...)                                                        \
  do {                                                                         \
    if (::tmopt::TmoptWarningFlag) {                                           \
      ::tmopt::errs() << "TMOPT WARNING: ";                                    \
      ::tmopt::___print___(::tmopt::errs(), __VA_ARGS__);                      \
      ::tmopt::errs() << "\n";                                                 \
    }                                                                          \
  } while (0)

} // end namespace tmopt
