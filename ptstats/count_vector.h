#ifndef _COUNT_VECTOR_H_
#define _COUNT_VECTOR_H_

#include <vector>

using namespace std;

namespace ptstats {

/**
 * Dense vector of event counts indexed by entity id.
 *
 * The vector only grows: incrementing an id past the end extends it with
 * zeros. Ids that were never incremented read as 0.
 */
class CountVector {
 public:
  CountVector();

  virtual ~CountVector();

  // Increments the count of the given id, growing the vector if needed.
  // Negative ids are ignored.
  void Increment(int id, int amount = 1);

  // Returns the count of the given id (0 for ids that were never seen).
  int Get(int id) const;

  // Returns the number of slots in the vector (the largest id seen + 1).
  int Size() const;

  // Checks if the id has a slot in the vector.
  bool Contains(int id) const;

  // Returns the sum of all counts.
  long long GetTotal() const;

  bool operator==(const CountVector& other) const;

 private:
  vector<int> counts;
};

} // namespace ptstats

#endif
