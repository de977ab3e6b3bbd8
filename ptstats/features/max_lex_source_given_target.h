#ifndef _MAX_LEX_SOURCE_GIVEN_TARGET_H_
#define _MAX_LEX_SOURCE_GIVEN_TARGET_H_

#include <memory>

#include "feature.h"
#include "scoring_config.h"

using namespace std;

namespace ptstats {

class LexicalTable;

namespace features {

/**
 * Feature computing the product over the source words of max(p(f | e)), where
 * e ranges over all the target words in the phrase pair and NULL.
 *
 * Unlike LexSourceGivenTarget, this feature ignores the alignment inside the
 * phrase pair. The maximum starts from the minimum lexical probability, so a
 * word never contributes less than it.
 */
class MaxLexSourceGivenTarget : public Feature {
 public:
  MaxLexSourceGivenTarget(shared_ptr<LexicalTable> table,
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
