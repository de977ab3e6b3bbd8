#ifndef _PHRASE_PAIR_BUILDER_H_
#define _PHRASE_PAIR_BUILDER_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace std;

namespace ptstats {

struct PhrasePair;
class Vocabulary;

/**
 * Component for constructing phrase pair candidates from text.
 */
class PhrasePairBuilder {
 public:
  PhrasePairBuilder(shared_ptr<Vocabulary> vocabulary);

  virtual ~PhrasePairBuilder();

  // Constructs a phrase pair from the source phrase, the target phrase and the
  // alignment between them. Gap tokens ([X], [X,1], ...) become nonterminals.
  // The alignment is either a list of i-j links or the per source word lists
  // used by Moses, e.g. "(0) (1,2) ()". Throws invalid_argument if the
  // alignment is malformed.
  PhrasePair Build(const string& source, const string& target,
                   const string& alignment);

  // Constructs a phrase pair from a "source ||| target ||| alignment" line.
  // Throws invalid_argument if the line doesn't have three fields.
  PhrasePair Parse(const string& line);

  // Parses an alignment string for a source phrase with the given number of
  // tokens.
  static vector<pair<int, int>> ParseAlignment(const string& alignment,
                                               int source_size);

 private:
  void ConvertTokens(const vector<string>& tokens, vector<int>* symbols,
                     vector<string>* words);

  shared_ptr<Vocabulary> vocabulary;
};

} // namespace ptstats

#endif
