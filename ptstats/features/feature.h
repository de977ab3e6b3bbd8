#ifndef _FEATURE_H_
#define _FEATURE_H_

#include <string>

#include "phrase_pair.h"

using namespace std;

namespace ptstats {
namespace features {

/**
 * Structure providing context for computing feature scores.
 */
struct FeatureContext {
  FeatureContext(const PhrasePair& phrase_pair, double pair_count,
                 double source_phrase_count, double target_phrase_count) :
    phrase_pair(phrase_pair), pair_count(pair_count),
    source_phrase_count(source_phrase_count),
    target_phrase_count(target_phrase_count) {}

  const PhrasePair& phrase_pair;
  double pair_count;
  double source_phrase_count;
  double target_phrase_count;
};

/**
 * Base class for features.
 */
class Feature {
 public:
  virtual double Score(const FeatureContext& context) const = 0;

  virtual string GetName() const = 0;

  virtual ~Feature();
};

} // namespace features
} // namespace ptstats

#endif
