#ifndef _PHRASE_SCORER_H_
#define _PHRASE_SCORER_H_

#include <memory>
#include <string>
#include <vector>

#include "scoring_config.h"

using namespace std;

namespace ptstats {

namespace features {
  class Feature;
} // namespace features

class CountAggregator;
struct PhrasePair;

/**
 * Computes the translation model features of a phrase pair.
 *
 * The features are phi(f | e), lex(f | e), phi(e | f) and lex(e | f), in this
 * order. Phrase pairs with phi(e | f) or lex(e | f) below the configured
 * cut-off values are rejected; phi(f | e) and lex(f | e) never cause a
 * rejection. Depending on the configuration, only the phi features are
 * returned, or the raw counts c(f, e), c(e) and c(f) are appended.
 *
 * Scoring only reads the counts, so it is safe to score phrase pairs from
 * several threads once the counting is done.
 */
class PhraseScorer {
 public:
  PhraseScorer(shared_ptr<CountAggregator> counts,
               shared_ptr<features::Feature> lex_source_given_target,
               shared_ptr<features::Feature> lex_target_given_source,
               const ScoringConfig& config);

  virtual ~PhraseScorer();

  // Computes the features of the phrase pair. Returns false if the phrase pair
  // was never counted or if it is filtered out.
  virtual bool Score(const PhrasePair& phrase_pair,
                     vector<double>* scores) const;

  // Returns the names of the features returned by Score.
  virtual vector<string> GetFeatureNames() const;

 protected:
  PhraseScorer();

 private:
  shared_ptr<CountAggregator> counts;
  shared_ptr<features::Feature> phi_source_given_target;
  shared_ptr<features::Feature> phi_target_given_source;
  shared_ptr<features::Feature> lex_source_given_target;
  shared_ptr<features::Feature> lex_target_given_source;
  ScoringConfig config;
};

// Creates a scorer using the lexical weights selected by the configuration.
shared_ptr<PhraseScorer> CreatePhraseScorer(shared_ptr<CountAggregator> counts,
                                            const ScoringConfig& config);

} // namespace ptstats

#endif
