#ifndef _LEX_TARGET_GIVEN_SOURCE_H_
#define _LEX_TARGET_GIVEN_SOURCE_H_

#include <memory>

#include "feature.h"
#include "scoring_config.h"

using namespace std;

namespace ptstats {

class LexicalTable;

namespace features {

/**
 * Lexical weight lex(e | f) of a phrase pair, the mirror image of
 * LexSourceGivenTarget: target words are explained by p(e | f) averaged over
 * their aligned source words or by p(e | NULL).
 */
class LexTargetGivenSource : public Feature {
 public:
  LexTargetGivenSource(shared_ptr<LexicalTable> table,
                       const ScoringConfig& config);

  double Score(const FeatureContext& context) const;

  string GetName() const;

 private:
  shared_ptr<LexicalTable> table;
  ScoringConfig config;
};

} // namespace features
} // namespace ptstats

#endif
