#include "phi_target_given_source.h"

namespace ptstats {
namespace features {

double PhiTargetGivenSource::Score(const FeatureContext& context) const {
  return context.pair_count / context.source_phrase_count;
}

string PhiTargetGivenSource::GetName() const {
  return "PhiEgivenF";
}

} // namespace features
} // namespace ptstats
