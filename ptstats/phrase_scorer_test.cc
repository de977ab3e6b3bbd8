#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "count_aggregator.h"
#include "mocks/mock_feature.h"
#include "phrase_index.h"
#include "phrase_pair.h"
#include "phrase_pair_builder.h"
#include "phrase_scorer.h"
#include "scoring_config.h"
#include "sentence_pair.h"
#include "vocabulary.h"

using namespace std;
using namespace ::testing;

namespace ptstats {
namespace {

class PhraseScorerTest : public Test {
 protected:
  virtual void SetUp() {
    config.exact = false;
    vocabulary = make_shared<Vocabulary>();
    builder = make_shared<PhrasePairBuilder>(vocabulary);
    counts = make_shared<CountAggregator>(config);

    // a b / x y, a / x and a c / z, where c is unaligned.
    counts->CountSentence(SentencePair(GetIds({"a", "b"}), GetIds({"x", "y"}),
                                       {{0, 0}, {1, 1}}));
    counts->CountSentence(SentencePair(GetIds({"a"}), GetIds({"x"}),
                                       {{0, 0}}));
    counts->CountSentence(SentencePair(GetIds({"a", "c"}), GetIds({"z"}),
                                       {{0, 0}}));

    a_x = AddPhrasePair("a ||| x ||| 0-0");
    AddPhrasePair("a ||| x ||| 0-0");
    a_z = AddPhrasePair("a ||| z ||| 0-0");
    ab_xy = AddPhrasePair("a b ||| x y ||| 0-0 1-1");
    b_x = AddPhrasePair("b ||| x ||| 0-0");
  }

  vector<int> GetIds(const vector<string>& words) {
    vector<int> word_ids;
    for (const string& word: words) {
      word_ids.push_back(vocabulary->GetTerminalIndex(word));
    }
    return word_ids;
  }

  PhrasePair AddPhrasePair(const string& line) {
    PhrasePair phrase_pair = builder->Parse(line);
    index.AddToIndex(&phrase_pair);
    counts->CountPhrase(phrase_pair);
    return phrase_pair;
  }

  vector<double> Score(const ScoringConfig& config,
                       const PhrasePair& phrase_pair) {
    vector<double> scores;
    EXPECT_TRUE(CreatePhraseScorer(counts, config)->Score(phrase_pair,
                                                          &scores));
    return scores;
  }

  void ExpectScores(const vector<double>& expected_scores,
                    const vector<double>& scores) {
    ASSERT_EQ(expected_scores.size(), scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
      EXPECT_NEAR(expected_scores[i], scores[i], 1e-12);
    }
  }

  ScoringConfig config;
  shared_ptr<Vocabulary> vocabulary;
  shared_ptr<PhrasePairBuilder> builder;
  shared_ptr<CountAggregator> counts;
  PhraseIndex index;
  PhrasePair a_x, a_z, ab_xy, b_x;
};

TEST_F(PhraseScorerTest, TestScore) {
  ExpectScores({2.0 / 3, 1, 2.0 / 3, 2.0 / 3}, Score(config, a_x));
  ExpectScores({1, 1, 1.0 / 3, 1.0 / 3}, Score(config, a_z));
  ExpectScores({1, 1, 1, 2.0 / 3}, Score(config, ab_xy));
  ExpectScores({1.0 / 3, ScoringConfig::MIN_LEX_PROB, 1,
                ScoringConfig::MIN_LEX_PROB}, Score(config, b_x));
}

TEST_F(PhraseScorerTest, TestIbmLexicalWeights) {
  config.ibm_lex_model = true;
  ExpectScores({1, 1, 1, 2.0 / 3}, Score(config, ab_xy));
  ExpectScores({2.0 / 3, 1, 2.0 / 3, 2.0 / 3}, Score(config, a_x));
}

TEST_F(PhraseScorerTest, TestOnlyPhi) {
  config.only_phi = true;
  ExpectScores({1, 1.0 / 3}, Score(config, a_z));
  vector<string> expected_names = {"PhiFgivenE", "PhiEgivenF"};
  EXPECT_EQ(expected_names, CreatePhraseScorer(counts, config)
      ->GetFeatureNames());
}

TEST_F(PhraseScorerTest, TestPrintCounts) {
  config.print_counts = true;
  ExpectScores({1, 1, 1.0 / 3, 1.0 / 3, 1, 1, 3}, Score(config, a_z));
  vector<string> expected_names = {"PhiFgivenE", "LexFgivenE", "PhiEgivenF",
                                   "LexEgivenF", "CountFE", "CountE",
                                   "CountF"};
  EXPECT_EQ(expected_names, CreatePhraseScorer(counts, config)
      ->GetFeatureNames());

  // The counts take precedence over only_phi.
  config.only_phi = true;
  EXPECT_EQ(7U, Score(config, a_z).size());
}

TEST_F(PhraseScorerTest, TestGetFeatureNames) {
  vector<string> expected_names = {"PhiFgivenE", "LexFgivenE", "PhiEgivenF",
                                   "LexEgivenF"};
  EXPECT_EQ(expected_names, CreatePhraseScorer(counts, config)
      ->GetFeatureNames());

  config.ibm_lex_model = true;
  expected_names = {"PhiFgivenE", "MaxLexFgivenE", "PhiEgivenF",
                    "MaxLexEgivenF"};
  EXPECT_EQ(expected_names, CreatePhraseScorer(counts, config)
      ->GetFeatureNames());
}

TEST_F(PhraseScorerTest, TestPhiFilterOnlyUsesTargetGivenSource) {
  config.phi_filter = 0.5;
  shared_ptr<PhraseScorer> scorer = CreatePhraseScorer(counts, config);
  vector<double> scores;
  // phi(e|f) = 1/3 is below the cut-off.
  EXPECT_FALSE(scorer->Score(a_z, &scores));
  EXPECT_TRUE(scores.empty());
  // phi(f|e) = 1/3 is not checked.
  EXPECT_TRUE(scorer->Score(b_x, &scores));
  EXPECT_NEAR(1.0 / 3, scores[0], 1e-12);
}

TEST_F(PhraseScorerTest, TestLexFilter) {
  config.lex_filter = 0.5;
  shared_ptr<PhraseScorer> scorer = CreatePhraseScorer(counts, config);
  vector<double> scores;
  EXPECT_FALSE(scorer->Score(a_z, &scores));
  EXPECT_FALSE(scorer->Score(b_x, &scores));
  EXPECT_TRUE(scorer->Score(a_x, &scores));
}

TEST_F(PhraseScorerTest, TestLexFilterOnlyUsesTargetGivenSource) {
  auto lex_source_given_target = make_shared<features::MockFeature>();
  EXPECT_CALL(*lex_source_given_target, Score(_))
      .WillRepeatedly(Return(0.0001));
  auto lex_target_given_source = make_shared<features::MockFeature>();
  EXPECT_CALL(*lex_target_given_source, Score(_))
      .WillRepeatedly(Return(0.9));

  config.lex_filter = 0.5;
  PhraseScorer scorer(counts, lex_source_given_target,
                      lex_target_given_source, config);
  vector<double> scores;
  EXPECT_TRUE(scorer.Score(a_x, &scores));
  ExpectScores({2.0 / 3, 0.0001, 2.0 / 3, 0.9}, scores);

  PhraseScorer reversed_scorer(counts, lex_target_given_source,
                               lex_source_given_target, config);
  EXPECT_FALSE(reversed_scorer.Score(a_x, &scores));
}

TEST_F(PhraseScorerTest, TestPhraseFilterRunsBeforeLexicalWeights) {
  auto lex_source_given_target = make_shared<features::MockFeature>();
  EXPECT_CALL(*lex_source_given_target, Score(_)).Times(0);
  auto lex_target_given_source = make_shared<features::MockFeature>();
  EXPECT_CALL(*lex_target_given_source, Score(_)).Times(0);

  config.phi_filter = 0.5;
  PhraseScorer scorer(counts, lex_source_given_target,
                      lex_target_given_source, config);
  vector<double> scores;
  EXPECT_FALSE(scorer.Score(a_z, &scores));
}

TEST_F(PhraseScorerTest, TestUncountedPhrasePair) {
  shared_ptr<PhraseScorer> scorer = CreatePhraseScorer(counts, config);
  PhrasePair phrase_pair = builder->Parse("b ||| z ||| 0-0");
  index.AddToIndex(&phrase_pair);
  vector<double> scores;
  EXPECT_FALSE(scorer->Score(phrase_pair, &scores));
  EXPECT_TRUE(scores.empty());

  PhrasePair unindexed_pair = builder->Parse("a ||| x ||| 0-0");
  EXPECT_FALSE(scorer->Score(unindexed_pair, &scores));
}

TEST_F(PhraseScorerTest, TestZeroCounts) {
  ScoringConfig exact_config;
  auto exact_counts = make_shared<CountAggregator>(exact_config);
  exact_counts->StartPass(1);
  PhrasePair phrase_pair = b_x;
  phrase_pair.pair_id = 1;
  exact_counts->CountPhrase(phrase_pair);

  shared_ptr<PhraseScorer> scorer =
      CreatePhraseScorer(exact_counts, exact_config);
  vector<double> scores;
  phrase_pair.pair_id = 0;
  EXPECT_FALSE(scorer->Score(phrase_pair, &scores));
}

TEST_F(PhraseScorerTest, TestScoresAreBounded) {
  vector<PhrasePair> phrase_pairs = {a_x, a_z, ab_xy, b_x};
  for (const PhrasePair& phrase_pair: phrase_pairs) {
    vector<double> scores = Score(config, phrase_pair);
    for (double score: scores) {
      EXPECT_GE(1, score);
      EXPECT_LE(config.min_lex_prob, score);
    }
    EXPECT_GE(scores[1], pow(config.min_lex_prob,
                             phrase_pair.source_symbols.size()));
    EXPECT_GE(scores[3], pow(config.min_lex_prob,
                             phrase_pair.target_symbols.size()));
  }
}

} // namespace
} // namespace ptstats
