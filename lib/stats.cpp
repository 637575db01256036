#include <bincfa/config.h>
#include <bincfa/support/stats.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace bincfa {
bool BincfaStatsFlag = false;
void BincfaEnableStats(bool v) { BincfaStatsFlag = v; }
} // namespace bincfa

#ifndef BINCFA_STATS
namespace bincfa {
Stopwatch::Stopwatch() {
  (void)started;
  (void)finished;
  (void)timeElapsed;
}
void Stopwatch::start() {}
void Stopwatch::stop() {}
void Stopwatch::resume() {}
long Stopwatch::systemTime() const { return (long)0; }
long Stopwatch::getTimeElapsed() const { return (long)0; }
double Stopwatch::toSeconds() const { return (double)0; }
void Stopwatch::Print(bincfa_os &out) const {}
void BincfaStats::reset() {}
void BincfaStats::count(const std::string &name) {}
unsigned BincfaStats::get(const std::string &n) { return (unsigned)0; }
void BincfaStats::start(const std::string &name) {}
void BincfaStats::stop(const std::string &name) {}
void BincfaStats::resume(const std::string &name) {}

void BincfaStats::Print(bincfa_os &OS) {
  OS << "\n\n************** STATS ***************** \n";
  OS << "bincfa compiled without support for gathering stats. "
     << "Compile with -DBINCFA_ENABLE_STATS=ON\n";
  OS << "************** STATS END ***************** \n";
}

ScopedBincfaStats::ScopedBincfaStats(const char *name, bool use_count)
    : m_name("") {}

ScopedBincfaStats::~ScopedBincfaStats() {}
} // namespace bincfa
#else
#include <sys/resource.h>
#include <sys/time.h>

namespace bincfa {

long Stopwatch::systemTime() const {
  struct rusage ru;
  getrusage(RUSAGE_SELF, &ru);
  long r = ru.ru_utime.tv_sec * 1000000L + ru.ru_utime.tv_usec;
  return r;
}

Stopwatch::Stopwatch() { start(); }

void Stopwatch::start() {
  started = systemTime();
  finished = -1;
  timeElapsed = 0;
}

void Stopwatch::stop() {
  if (finished < started) {
    finished = systemTime();
  }
}

void Stopwatch::resume() {
  if (finished >= started) {
    timeElapsed += finished - started;
    started = systemTime();
    finished = -1;
  }
}

long Stopwatch::getTimeElapsed() const {
  if (finished < started)
    return timeElapsed + systemTime() - started;
  else
    return timeElapsed + finished - started;
}

double Stopwatch::toSeconds() const {
  return ((double)getTimeElapsed() / 1000000);
}

void Stopwatch::Print(bincfa_os &out) const {
  long time = getTimeElapsed();
  long m = time / 60000000L;
  double s = ((double)time / 1000000L) - m * 60;
  if (m > 0)
    out << m << "m";
  out << s << "s";
}

std::unordered_map<std::string, unsigned> &BincfaStats::getCounters() {
  static std::unordered_map<std::string, unsigned> counters;
  return counters;
}

std::unordered_map<std::string, Stopwatch> &BincfaStats::getTimers() {
  static std::unordered_map<std::string, Stopwatch> timers;
  return timers;
}

void BincfaStats::reset() {
  if (BincfaStatsFlag) {
    getCounters().clear();
    getTimers().clear();
  }
}

void BincfaStats::count(const std::string &name) {
  if (BincfaStatsFlag) {
    ++getCounters()[name];
  }
}

unsigned BincfaStats::get(const std::string &n) {
  if (BincfaStatsFlag) {
    return getCounters()[n];
  } else {
    return 0;
  }
}

void BincfaStats::start(const std::string &name) {
  if (BincfaStatsFlag) {
    getTimers()[name].start();
  }
}

void BincfaStats::stop(const std::string &name) {
  if (BincfaStatsFlag) {
    getTimers()[name].stop();
  }
}

void BincfaStats::resume(const std::string &name) {
  if (BincfaStatsFlag) {
    getTimers()[name].resume();
  }
}

void BincfaStats::Print(bincfa_os &OS) {
  if (!BincfaStatsFlag) {
    OS << "\n\n************** STATS ***************** \n";
    OS << "Need to call BincfaEnableStats()\n";
    OS << "************** STATS END ***************** \n";
    return;
  }

  std::vector<std::pair<std::string, unsigned>> counters(
      getCounters().begin(), getCounters().end());
  std::vector<std::pair<std::string, Stopwatch>> timers(getTimers().begin(),
                                                        getTimers().end());
  std::sort(counters.begin(), counters.end(),
            [](const std::pair<std::string, unsigned> &p1,
               const std::pair<std::string, unsigned> &p2) {
              return p1.first < p2.first;
            });
  std::sort(timers.begin(), timers.end(),
            [](const std::pair<std::string, Stopwatch> &p1,
               const std::pair<std::string, Stopwatch> &p2) {
              return p1.first < p2.first;
            });
  OS << "\n\n************** STATS ***************** \n";
  for (auto &kv : counters)
    OS << kv.first << ": " << kv.second << "\n";
  for (auto &kv : timers)
    OS << kv.first << ": " << kv.second << "\n";
  OS << "************** STATS END ***************** \n";
}

ScopedBincfaStats::ScopedBincfaStats(const char *name, bool use_count)
    : m_name(name) {
  if (BincfaStatsFlag) {
    BincfaStats::resume(m_name);
    if (use_count) {
      BincfaStats::count(m_name);
    }
  }
}

ScopedBincfaStats::~ScopedBincfaStats() {
  if (BincfaStatsFlag) {
    BincfaStats::stop(m_name);
  }
}

} // namespace bincfa
#endif
