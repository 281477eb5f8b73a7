#include <tmopt/config.h>
#include <tmopt/support/stats.hpp>

#include <algorithm>

namespace tmopt {
bool TmoptStatsFlag = false;
void TmoptEnableStats(bool v) { TmoptStatsFlag = v; }
} // namespace tmopt

#ifndef TMOPT_STATS
namespace tmopt {
Stopwatch::Stopwatch() : m_elapsed(0), m_started(-1) {}
long Stopwatch::now() { return 0; }
void Stopwatch::resume() {}
void Stopwatch::stop() {}
long Stopwatch::elapsed() const { return 0; }
void Stopwatch::Print(tmopt_os &out) const {}

void TmoptStats::count(const std::string &name) {}
void TmoptStats::count_max(const std::string &name, unsigned v) {}
void TmoptStats::resume(const std::string &name) {}
void TmoptStats::stop(const std::string &name) {}

void TmoptStats::Print(tmopt_os &o) {
  o << "tmopt built without stats. Configure with -DTMOPT_ENABLE_STATS=ON\n";
}

ScopedTmoptStats::ScopedTmoptStats(const char *name) {}
ScopedTmoptStats::~ScopedTmoptStats() {}
} // namespace tmopt
#else
#include <sys/resource.h>
#include <sys/time.h>

namespace tmopt {

long Stopwatch::now() {
  struct rusage ru;
  getrusage(RUSAGE_SELF, &ru);
  return ru.ru_utime.tv_sec * 1000000L + ru.ru_utime.tv_usec;
}

Stopwatch::Stopwatch() : m_elapsed(0), m_started(-1) {}

void Stopwatch::resume() {
  if (m_started < 0) {
    m_started = now();
  }
}

void Stopwatch::stop() {
  if (m_started >= 0) {
    m_elapsed += now() - m_started;
    m_started = -1;
  }
}

long Stopwatch::elapsed() const {
  return m_started < 0 ? m_elapsed : m_elapsed + now() - m_started;
}

void Stopwatch::Print(tmopt_os &out) const {
  out << (double)elapsed() / 1000000.0 << "s";
}

std::map<std::string, unsigned> &TmoptStats::counters() {
  static std::map<std::string, unsigned> m;
  return m;
}

std::map<std::string, Stopwatch> &TmoptStats::timers() {
  static std::map<std::string, Stopwatch> m;
  return m;
}

void TmoptStats::count(const std::string &name) {
  if (TmoptStatsFlag) {
    ++counters()[name];
  }
}

void TmoptStats::count_max(const std::string &name, unsigned v) {
  if (TmoptStatsFlag) {
    unsigned &c = counters()[name];
    c = std::max(c, v);
  }
}

void TmoptStats::resume(const std::string &name) {
  if (TmoptStatsFlag) {
    timers()[name].resume();
  }
}

void TmoptStats::stop(const std::string &name) {
  if (TmoptStatsFlag) {
    timers()[name].stop();
  }
}

void TmoptStats::Print(tmopt_os &o) {
  if (!TmoptStatsFlag) {
    o << "stats are disabled. Call TmoptEnableStats()\n";
    return;
  }
  o << "=== tmopt stats ===\n";
  for (auto const &kv : counters()) {
    o << kv.first << ": " << kv.second << "\n";
  }
  for (auto const &kv : timers()) {
    o << kv.first << ": " << kv.second << "\n";
  }
  o << "===================\n";
}

ScopedTmoptStats::ScopedTmoptStats(const char *name) : m_name(name) {
  if (TmoptStatsFlag) {
    TmoptStats::count(m_name);
    TmoptStats::resume(m_name);
  }
}

ScopedTmoptStats::~ScopedTmoptStats() {
  if (TmoptStatsFlag) {
    TmoptStats::stop(m_name);
  }
}

} // namespace tmopt
#endif
