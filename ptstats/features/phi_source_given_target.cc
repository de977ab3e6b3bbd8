#include "phi_source_given_target.h"

namespace ptstats {
namespace features {

double PhiSourceGivenTarget::Score(const FeatureContext& context) const {
  return context.pair_count / context.target_phrase_count;
}

string PhiSourceGivenTarget::GetName() const {
  return "PhiFgivenE";
}

} // namespace features
} // namespace ptstats
