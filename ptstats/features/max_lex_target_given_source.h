#ifndef _MAX_LEX_TARGET_GIVEN_SOURCE_H_
#define _MAX_LEX_TARGET_GIVEN_SOURCE_H_

#include <memory>

#include "feature.h"
#include "scoring_config.h"

using namespace std;

namespace ptstats {

class LexicalTable;

namespace features {

/**
 * Feature computing the product over the target words of max(p(e | f)), where
 * f ranges over all the source words in the phrase pair and NULL.
 */
class MaxLexTargetGivenSource : public Feature {
 public:
  MaxLexTargetGivenSource(shared_ptr<LexicalTable> table,
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
