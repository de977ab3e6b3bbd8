#include "tuple_index.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <boost/functional/hash.hpp>

namespace ptstats {

namespace {

const int EMPTY_SLOT = -1;

size_t GetTableSize(int initial_capacity) {
  size_t size = 2;
  while (size < static_cast<size_t>(initial_capacity)) {
    size <<= 1;
  }
  return size;
}

} // namespace

TupleIndex::TupleIndex(int arity, int initial_capacity) : arity(arity) {
  if (arity <= 0) {
    throw invalid_argument("Tuple arity must be positive, got " +
                           to_string(arity));
  }
  size_t table_size = GetTableSize(initial_capacity);
  mask = table_size - 1;
  slots.assign(table_size, EMPTY_SLOT);
}

TupleIndex::~TupleIndex() {}

int TupleIndex::IndexOf(const vector<int>& tuple, bool create) {
  if (tuple.size() != static_cast<size_t>(arity)) {
    throw invalid_argument("Expected tuple of size " + to_string(arity) +
                           ", got " + to_string(tuple.size()));
  }
  return IndexOf(tuple.data(), create);
}

int TupleIndex::Find(const vector<int>& tuple) const {
  if (tuple.size() != static_cast<size_t>(arity)) {
    throw invalid_argument("Expected tuple of size " + to_string(arity) +
                           ", got " + to_string(tuple.size()));
  }
  return Find(tuple.data());
}

int TupleIndex::IndexOf(const int* tuple, bool create) {
  size_t slot = FindSlot(tuple);
  if (slots[slot] != EMPTY_SLOT) {
    return slots[slot];
  }
  if (!create) {
    return -1;
  }

  int id = Size();
  keys.insert(keys.end(), tuple, tuple + arity);
  slots[slot] = id;
  // Keeps the load factor at most 1/2, so probing sequences stay short.
  if (2 * keys.size() / arity > slots.size()) {
    Grow();
  }
  return id;
}

int TupleIndex::Find(const int* tuple) const {
  return slots[FindSlot(tuple)];
}

vector<int> TupleIndex::Get(int id) const {
  if (id < 0 || id >= Size()) {
    throw out_of_range("No tuple with id " + to_string(id));
  }
  return vector<int>(keys.begin() + id * arity,
                     keys.begin() + (id + 1) * arity);
}

int TupleIndex::GetArity() const {
  return arity;
}

int TupleIndex::Size() const {
  return keys.size() / arity;
}

size_t TupleIndex::FindSlot(const int* tuple) const {
  size_t slot = Hash(tuple) & mask;
  while (slots[slot] != EMPTY_SLOT && !Equals(slots[slot], tuple)) {
    slot = (slot + 1) & mask;
  }
  return slot;
}

size_t TupleIndex::Hash(const int* tuple) const {
  size_t seed = boost::hash_range(tuple, tuple + arity);
  // Spreads the low bits, boost::hash<int> is the identity.
  return seed * 0x9E3779B97F4A7C15ULL ^ (seed >> 29);
}

bool TupleIndex::Equals(int id, const int* tuple) const {
  return equal(tuple, tuple + arity, keys.begin() + id * arity);
}

void TupleIndex::Grow() {
  slots.assign(slots.size() * 2, EMPTY_SLOT);
  mask = slots.size() - 1;
  int num_ids = Size();
  for (int id = 0; id < num_ids; ++id) {
    size_t slot = Hash(&keys[id * arity]) & mask;
    while (slots[slot] != EMPTY_SLOT) {
      slot = (slot + 1) & mask;
    }
    slots[slot] = id;
  }
}

WordIndex::WordIndex(int initial_capacity) :
    TupleIndex(1, initial_capacity) {}

int WordIndex::IndexOf(int word_id, bool create) {
  return TupleIndex::IndexOf(&word_id, create);
}

int WordIndex::Find(int word_id) const {
  return TupleIndex::Find(&word_id);
}

int WordIndex::GetWord(int id) const {
  return Get(id)[0];
}

} // namespace ptstats
