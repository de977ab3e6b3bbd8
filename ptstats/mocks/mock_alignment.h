#include <gmock/gmock.h>

#include "alignment.h"

namespace ptstats {

typedef vector<pair<int, int> > SentenceLinks;

class MockAlignment : public Alignment {
 public:
  MOCK_CONST_METHOD1(GetLinks, SentenceLinks(int sentence_id));
  MOCK_CONST_METHOD0(GetNumSentences, int());
};

} // namespace ptstats
