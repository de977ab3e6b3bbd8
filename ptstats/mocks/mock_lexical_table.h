#include <gmock/gmock.h>

#include "lexical_table.h"

namespace ptstats {

class MockLexicalTable : public LexicalTable {
 public:
  MOCK_CONST_METHOD2(GetSourceGivenTargetScore, double(int, int));
  MOCK_CONST_METHOD2(GetTargetGivenSourceScore, double(int, int));
};

} // namespace ptstats
