#ifndef _TIME_UTIL_H_
#define _TIME_UTIL_H_

#include <chrono>

using namespace std;
using namespace chrono;

namespace ptstats {

typedef steady_clock Clock;

// Computes the duration in seconds of the specified time interval.
double GetDuration(const Clock::time_point& start_time,
                   const Clock::time_point& stop_time);

/**
 * Measures the wall time of the stages of a scoring run.
 */
class StageTimer {
 public:
  StageTimer();

  // Starts measuring a new stage.
  void Restart();

  // Returns the number of seconds since the current stage started.
  double GetElapsedSeconds() const;

 private:
  Clock::time_point start_time;
};

} // namespace ptstats

#endif
