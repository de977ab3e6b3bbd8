#include <gmock/gmock.h>

#include "phrase_pair.h"
#include "phrase_scorer.h"

namespace ptstats {

class MockPhraseScorer : public PhraseScorer {
 public:
  MOCK_CONST_METHOD2(Score, bool(const PhrasePair& phrase_pair,
                                 vector<double>* scores));
  MOCK_CONST_METHOD0(GetFeatureNames, vector<string>());
};

} // namespace ptstats
