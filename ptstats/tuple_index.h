#ifndef _TUPLE_INDEX_H_
#define _TUPLE_INDEX_H_

#include <vector>

using namespace std;

namespace ptstats {

/**
 * Open addressed hash index mapping fixed-arity integer tuples to dense ids.
 *
 * Tuples are stored back to back in a single flat array, so the id of a tuple
 * is also its offset in that array (divided by the arity). The probing table
 * only holds ids. Ids are assigned sequentially starting from 0 and never
 * change, not even when the probing table is resized, which allows them to be
 * used directly as offsets in count vectors.
 *
 * Note: The index is not thread safe. Writers must serialize calls that may
 * create new ids; lookups are safe once all the writers are done.
 */
class TupleIndex {
 public:
  // Creates an empty index for tuples with the given number of elements.
  TupleIndex(int arity, int initial_capacity = 1024);

  virtual ~TupleIndex();

  // Returns the id of the given tuple. If the tuple is missing and create is
  // set, the tuple is assigned the next free id, otherwise -1 is returned.
  int IndexOf(const vector<int>& tuple, bool create);

  // Returns the id of the given tuple or -1 if the tuple is missing.
  int Find(const vector<int>& tuple) const;

  // Returns the tuple stored under the given id.
  vector<int> Get(int id) const;

  // Returns the number of elements in every tuple.
  int GetArity() const;

  // Returns the number of distinct tuples (i.e. the next id to be assigned).
  int Size() const;

 protected:
  int IndexOf(const int* tuple, bool create);

  int Find(const int* tuple) const;

 private:
  // Returns the position of the slot holding the tuple or the position of the
  // first empty slot on its probing sequence.
  size_t FindSlot(const int* tuple) const;

  size_t Hash(const int* tuple) const;

  bool Equals(int id, const int* tuple) const;

  // Doubles the probing table and reinserts every id.
  void Grow();

  int arity;
  size_t mask;
  vector<int> keys;
  vector<int> slots;
};

/**
 * Index mapping single integers (word ids) to dense ids.
 */
class WordIndex : public TupleIndex {
 public:
  WordIndex(int initial_capacity = 1024);

  // Returns the dense id of the given word, creating it if requested.
  int IndexOf(int word_id, bool create);

  // Returns the dense id of the given word or -1 if it is missing.
  int Find(int word_id) const;

  // Returns the word stored under the given dense id.
  int GetWord(int id) const;
};

} // namespace ptstats

#endif
