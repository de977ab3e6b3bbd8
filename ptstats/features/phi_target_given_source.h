#ifndef _PHI_TARGET_GIVEN_SOURCE_H_
#define _PHI_TARGET_GIVEN_SOURCE_H_

#include "feature.h"

namespace ptstats {
namespace features {

/**
 * Relative frequency of the phrase pair: phi(e | f) = c(f, e) / c(f).
 */
class PhiTargetGivenSource : public Feature {
 public:
  double Score(const FeatureContext& context) const;

  string GetName() const;
};

} // namespace features
} // namespace ptstats

#endif
