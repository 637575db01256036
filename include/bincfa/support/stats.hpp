#pragma once

#include <bincfa/support/os.hpp>

#include <string>
#include <unordered_map>

namespace bincfa {

extern bool BincfaStatsFlag;
void BincfaEnableStats(bool v = true);

class Stopwatch {
  long started;
  long finished;
  long timeElapsed;

  long systemTime() const;

public:
  Stopwatch();
  void start();
  void stop();
  void resume();
  long getTimeElapsed() const;
  void Print(bincfa_os &out) const;
  double toSeconds() const;
};

inline bincfa_os &operator<<(bincfa_os &OS, const Stopwatch &sw) {
  sw.Print(OS);
  return OS;
}

class BincfaStats {
  static std::unordered_map<std::string, unsigned> &getCounters();
  static std::unordered_map<std::string, Stopwatch> &getTimers();

public:
  static void reset();

  /* counters */
  static unsigned get(const std::string &n);
  static void count(const std::string &name);

  /* stop watch */
  static void start(const std::string &name);
  static void stop(const std::string &name);
  static void resume(const std::string &name);

  /** Outputs all statistics sorted by name */
  static void Print(bincfa_os &OS);
};

class ScopedBincfaStats {
  std::string m_name;

public:
  // Call count and resume on name
  ScopedBincfaStats(const char *name, bool use_count = true);
  ~ScopedBincfaStats();
};
} // namespace bincfa

/**
 *   BINCFA_SCOPED_STATS(name, active)
 *     increase **both** timer and counter for name if active=1
 *   BINCFA_COUNT_STATS(name, active)
 *     increment only counter for name if active=1
 **/
#include <bincfa/config.h>
#ifdef BINCFA_STATS
#define BINCFA_SCOPED_STATS(name, active) BINCFA_SCOPED_STATS_(name, active)
#define BINCFA_SCOPED_STATS_(name, active) BINCFA_SCOPED_STATS_##active(name)
#define BINCFA_SCOPED_STATS_0(name)
#define BINCFA_SCOPED_STATS_1(name) ::bincfa::ScopedBincfaStats __st__(name, true);

#define BINCFA_COUNT_STATS(name, active) BINCFA_COUNT_STATS_(name, active)
#define BINCFA_COUNT_STATS_(name, active) BINCFA_COUNT_STATS_##active(name)
#define BINCFA_COUNT_STATS_0(name)
#define BINCFA_COUNT_STATS_1(name) ::bincfa::BincfaStats::count(name);
#else
#define BINCFA_SCOPED_STATS(name, active)
#define BINCFA_COUNT_STATS(name, active)
#endif
