#ifndef _PHI_SOURCE_GIVEN_TARGET_H_
#define _PHI_SOURCE_GIVEN_TARGET_H_

#include "feature.h"

namespace ptstats {
namespace features {

/**
 * Relative frequency of the phrase pair: phi(f | e) = c(f, e) / c(e).
 */
class PhiSourceGivenTarget : public Feature {
 public:
  double Score(const FeatureContext& context) const;

  string GetName() const;
};

} // namespace features
} // namespace ptstats

#endif
