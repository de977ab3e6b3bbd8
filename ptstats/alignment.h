#ifndef _ALIGNMENT_H_
#define _ALIGNMENT_H_

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace std;

namespace ptstats {

/**
 * Data structure storing the word alignments for a parallel corpus.
 *
 * Every line holds the alignment of one sentence pair as a list of i-j links
 * (source position i, target position j).
 */
class Alignment {
 public:
  // Reads the alignment from a stream. Throws runtime_error on malformed links.
  Alignment(istream& input);

  // Creates empty alignment.
  Alignment();

  virtual ~Alignment();

  // Returns the alignment for a given sentence.
  virtual vector<pair<int, int>> GetLinks(int sentence_index) const;

  // Returns the number of aligned sentences.
  virtual int GetNumSentences() const;

  bool operator==(const Alignment& alignment) const;

 private:
  vector<vector<pair<int, int>>> alignments;
};

} // namespace ptstats

#endif
