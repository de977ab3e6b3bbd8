#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "lex_target_given_source.h"
#include "mocks/mock_lexical_table.h"
#include "vocabulary.h"

using namespace std;
using namespace ::testing;

namespace ptstats {
namespace features {
namespace {

class LexTargetGivenSourceTest : public Test {
 protected:
  virtual void SetUp() {
    table = make_shared<MockLexicalTable>();
    EXPECT_CALL(*table, GetTargetGivenSourceScore(_, _))
        .WillRepeatedly(Return(0));
    EXPECT_CALL(*table, GetTargetGivenSourceScore(1, 3))
        .WillRepeatedly(Return(0.6));
    EXPECT_CALL(*table, GetTargetGivenSourceScore(2, 3))
        .WillRepeatedly(Return(0.2));
    EXPECT_CALL(*table, GetTargetGivenSourceScore(1, 4))
        .WillRepeatedly(Return(0.3));
    EXPECT_CALL(*table, GetTargetGivenSourceScore(Vocabulary::NULL_WORD, 5))
        .WillRepeatedly(Return(0.1));

    feature = make_shared<LexTargetGivenSource>(table, config);
  }

  double Score(const PhrasePair& phrase_pair) {
    FeatureContext context(phrase_pair, 1, 1, 1);
    return feature->Score(context);
  }

  ScoringConfig config;
  shared_ptr<MockLexicalTable> table;
  shared_ptr<LexTargetGivenSource> feature;
};

TEST_F(LexTargetGivenSourceTest, TestGetName) {
  EXPECT_EQ("LexEgivenF", feature->GetName());
}

TEST_F(LexTargetGivenSourceTest, TestAveragedLinks) {
  // e1 is aligned to f1 and f2, e2 to f1 and e3 is unaligned.
  PhrasePair phrase_pair({1, 2}, {3, 4, 5}, {"f1", "f2"}, {"e1", "e2", "e3"},
                         {{0, 0}, {1, 0}, {0, 1}});
  EXPECT_DOUBLE_EQ(0.4 * 0.3 * 0.1, Score(phrase_pair));
}

TEST_F(LexTargetGivenSourceTest, TestMinimumProbability) {
  PhrasePair phrase_pair({2}, {4}, {"f2"}, {"e2"}, {{0, 0}});
  EXPECT_DOUBLE_EQ(ScoringConfig::MIN_LEX_PROB, Score(phrase_pair));

  config.min_lex_prob = 0.01;
  feature = make_shared<LexTargetGivenSource>(table, config);
  EXPECT_DOUBLE_EQ(0.01, Score(phrase_pair));
}

TEST_F(LexTargetGivenSourceTest, TestGapsAreSkipped) {
  PhrasePair phrase_pair({-1, 1}, {3, -1}, {"f1"}, {"e1"}, {{1, 0}});
  EXPECT_DOUBLE_EQ(0.6, Score(phrase_pair));
}

} // namespace
} // namespace features
} // namespace ptstats
