#include "feature.h"

namespace ptstats {
namespace features {

Feature::~Feature() {}

} // namespace features
} // namespace ptstats
