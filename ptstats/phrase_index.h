#ifndef _PHRASE_INDEX_H_
#define _PHRASE_INDEX_H_

#include <unordered_map>
#include <vector>

#include <boost/functional/hash.hpp>

using namespace std;

namespace ptstats {

struct PhrasePair;

typedef boost::hash<vector<int>> PhraseHash;

/**
 * Assigns the ids used to count phrase pairs.
 *
 * A phrase pair gets three ids: one for the (source, target) pair and one for
 * each of its phrases. Ids are dense, start at 0 and are never reused, so they
 * can be used as offsets in the phrase count vectors. This is the id authority
 * the phrase collector works with; the scorer only consumes the ids.
 */
class PhraseIndex {
 public:
  PhraseIndex();

  virtual ~PhraseIndex();

  // Sets the three ids of the phrase pair, assigning new ids to phrases and
  // pairs that were never seen before.
  virtual void AddToIndex(PhrasePair* phrase_pair);

  // Sets the ids of the phrase pair without assigning new ones. Missing ids are
  // set to -1. Returns true if all three ids are known.
  bool Lookup(PhrasePair* phrase_pair) const;

  // Returns the number of distinct phrase pairs.
  int GetNumPairs() const;

  // Returns the number of distinct source phrases.
  int GetNumSourcePhrases() const;

  // Returns the number of distinct target phrases.
  int GetNumTargetPhrases() const;

 private:
  typedef unordered_map<vector<int>, int, PhraseHash> PhraseIds;

  static int AddPhrase(PhraseIds& ids, const vector<int>& key);

  static int FindPhrase(const PhraseIds& ids, const vector<int>& key);

  static vector<int> GetPairKey(const PhrasePair& phrase_pair);

  PhraseIds pair_ids;
  PhraseIds source_ids;
  PhraseIds target_ids;
};

} // namespace ptstats

#endif
