#include "time_util.h"

namespace ptstats {

double GetDuration(const Clock::time_point& start_time,
                   const Clock::time_point& stop_time) {
  return duration_cast<milliseconds>(stop_time - start_time).count() / 1000.0;
}

StageTimer::StageTimer() : start_time(Clock::now()) {}

void StageTimer::Restart() {
  start_time = Clock::now();
}

double StageTimer::GetElapsedSeconds() const {
  return GetDuration(start_time, Clock::now());
}

} // namespace ptstats
