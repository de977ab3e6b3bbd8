#ifndef _PHRASE_PAIR_H_
#define _PHRASE_PAIR_H_

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace std;

namespace ptstats {

/**
 * Phrase pair candidate handed over by the phrase collector.
 *
 * Besides the phrases and their internal alignment, a candidate carries three
 * ids assigned upstream: the id of the pair itself (offset in the joint count
 * vector) and the ids of its source and target phrases (offsets in the
 * marginal count vectors). Unassigned ids are -1.
 *
 * Symbols are word ids, except for gaps in discontinuous phrases which are
 * negative nonterminal ids. The words vectors hold the surface form of the
 * terminals only and are used for diagnostics.
 */
struct PhrasePair {
  PhrasePair();

  // Throws invalid_argument if a link points outside one of the phrases.
  // Repeated links are kept once.
  PhrasePair(const vector<int>& source_symbols,
             const vector<int>& target_symbols,
             const vector<string>& source_words,
             const vector<string>& target_words,
             const vector<pair<int, int>>& links);

  // Returns the source phrase as text, with gaps printed as [X,k].
  string GetSourceString() const;

  // Returns the target phrase as text, with gaps printed as [X,k].
  string GetTargetString() const;

  // Returns the word at the given source position ([X,k] for gaps).
  string GetSourceWord(int position) const;

  // Returns the word at the given target position ([X,k] for gaps).
  string GetTargetWord(int position) const;

  // Returns the alignment as a sequence of i-j links.
  string GetAlignmentString() const;

  friend ostream& operator<<(ostream& os, const PhrasePair& phrase_pair);

  int pair_id;
  int source_id;
  int target_id;
  vector<int> source_symbols;
  vector<int> target_symbols;
  vector<string> source_words;
  vector<string> target_words;
  vector<pair<int, int>> links;
  vector<vector<int>> f2e;
  vector<vector<int>> e2f;
};

} // namespace ptstats

#endif
