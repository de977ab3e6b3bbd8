#ifndef _SENTENCE_PAIR_H_
#define _SENTENCE_PAIR_H_

#include <utility>
#include <vector>

using namespace std;

namespace ptstats {

/**
 * Word aligned sentence pair.
 *
 * Holds the word ids of both sentences together with the alignment indexed in
 * both directions: f2e[i] lists the target positions linked to source position
 * i and e2f[j] lists the source positions linked to target position j.
 */
struct SentencePair {
  SentencePair();

  // Throws invalid_argument if a link points outside one of the sentences.
  // Repeated links are kept once.
  SentencePair(const vector<int>& source, const vector<int>& target,
               const vector<pair<int, int>>& links);

  bool operator==(const SentencePair& other) const;

  vector<int> source;
  vector<int> target;
  vector<vector<int>> f2e;
  vector<vector<int>> e2f;
};

} // namespace ptstats

#endif
