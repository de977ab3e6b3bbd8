#ifndef _LEXICAL_TABLE_H_
#define _LEXICAL_TABLE_H_

#include <memory>

using namespace std;

namespace ptstats {

class CountAggregator;

/**
 * Bilexical table with conditional probabilities.
 *
 * The probabilities are computed on demand from the word counts:
 *   p(f | e) = c(f, e) / c(e)
 *   p(e | f) = c(f, e) / c(f)
 * The two are generally not reciprocal, the denominators are different.
 */
class LexicalTable {
 public:
  LexicalTable(shared_ptr<CountAggregator> counts);

  virtual ~LexicalTable();

  // Returns p(f | e) or 0 if the words were never aligned.
  virtual double GetSourceGivenTargetScore(int source_word,
                                           int target_word) const;

  // Returns p(e | f) or 0 if the words were never aligned.
  virtual double GetTargetGivenSourceScore(int source_word,
                                           int target_word) const;

 protected:
  LexicalTable();

 private:
  shared_ptr<CountAggregator> counts;
};

} // namespace ptstats

#endif
