#pragma once

#include <tmopt/support/os.hpp>

#include <map>
#include <string>

namespace tmopt {

extern bool TmoptStatsFlag;
void TmoptEnableStats(bool v = true);

// Accumulates user time (in microseconds) between resume() and stop()
class Stopwatch {
  long m_elapsed;
  // start of the running interval, or -1 if stopped
  long m_started;

  static long now();

public:
  Stopwatch();
  void resume();
  void stop();
  long elapsed() const;
  void Print(tmopt_os &out) const;
};

inline tmopt_os &operator<<(tmopt_os &o, const Stopwatch &sw) {
  sw.Print(o);
  return o;
}

class TmoptStats {
  static std::map<std::string, unsigned> &counters();
  static std::map<std::string, Stopwatch> &timers();

public:
  static void count(const std::string &name);
  static void count_max(const std::string &name, unsigned v);

  static void resume(const std::string &name);
  static void stop(const std::string &name);

  // Counters and timers sorted by name
  static void Print(tmopt_os &o);
};

// Counts name and times the enclosing scope
class ScopedTmoptStats {
  std::string m_name;

public:
  ScopedTmoptStats(const char *name);
  ~ScopedTmoptStats();
};
} // namespace tmopt

/**
 *   TMOPT_SCOPED_STATS(name): count name and time the scope
 *   TMOPT_COUNT_STATS(name): count name
 **/
#include <tmopt/config.h>
#ifdef TMOPT_STATS
#define TMOPT_SCOPED_STATS(name) ::tmopt::ScopedTmoptStats __st__(name);
#define TMOPT_COUNT_STATS(name) ::tmopt::TmoptStats::count(name);
#else
#define TMOPT_SCOPED_STATS(name)
#define TMOPT_COUNT_STATS(name)
#endif
