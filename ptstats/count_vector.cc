#include "count_vector.h"

namespace ptstats {

CountVector::CountVector() {}

CountVector::~CountVector() {}

void CountVector::Increment(int id, int amount) {
  if (id < 0) {
    return;
  }
  if (static_cast<size_t>(id) >= counts.size()) {
    counts.resize(id + 1, 0);
  }
  counts[id] += amount;
}

int CountVector::Get(int id) const {
  if (!Contains(id)) {
    return 0;
  }
  return counts[id];
}

int CountVector::Size() const {
  return counts.size();
}

bool CountVector::Contains(int id) const {
  return id >= 0 && static_cast<size_t>(id) < counts.size();
}

long long CountVector::GetTotal() const {
  long long total = 0;
  for (int count: counts) {
    total += count;
  }
  return total;
}

bool CountVector::operator==(const CountVector& other) const {
  return counts == other.counts;
}

} // namespace ptstats
