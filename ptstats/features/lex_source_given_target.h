#ifndef _LEX_SOURCE_GIVEN_TARGET_H_
#define _LEX_SOURCE_GIVEN_TARGET_H_

#include <memory>

#include "feature.h"
#include "scoring_config.h"

using namespace std;

namespace ptstats {

class LexicalTable;

namespace features {

/**
 * Lexical weight lex(f | e) of a phrase pair, as computed by Moses.
 *
 * Every source word must be explained: its weight is p(f | e) averaged over
 * the target words it is aligned to, or p(f | NULL) if it is unaligned. The
 * feature is the product of the word weights. Gaps are skipped and zero
 * weights are replaced by the configured minimum probability.
 */
class LexSourceGivenTarget : public Feature {
 public:
  LexSourceGivenTarget(shared_ptr<LexicalTable> table,
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
