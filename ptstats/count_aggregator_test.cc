#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <vector>

#include "count_aggregator.h"
#include "phrase_pair.h"
#include "scoring_config.h"
#include "sentence_pair.h"
#include "vocabulary.h"

using namespace std;
using namespace ::testing;

namespace ptstats {
namespace {

const int NULL_WORD = Vocabulary::NULL_WORD;

class CountAggregatorTest : public Test {
 protected:
  virtual void SetUp() {
    fast_config.exact = false;
  }

  PhrasePair MakePhrasePair(int pair_id, int source_id, int target_id) {
    PhrasePair phrase_pair;
    phrase_pair.pair_id = pair_id;
    phrase_pair.source_id = source_id;
    phrase_pair.target_id = target_id;
    return phrase_pair;
  }

  // Checks that c(e) is the sum of c(f, e) over f and c(f) the sum of c(f, e)
  // over e.
  void CheckMarginals(const CountAggregator& counts) {
    map<int, int> source_totals, target_totals;
    const TupleIndex& index = counts.GetWordPairIndex();
    for (int slot = 0; slot < index.Size(); ++slot) {
      vector<int> word_pair = index.Get(slot);
      int count = counts.GetWordPairCounts().Get(slot);
      source_totals[word_pair[0]] += count;
      target_totals[word_pair[1]] += count;
    }
    for (auto total: source_totals) {
      EXPECT_EQ(total.second, counts.GetSourceWordCount(total.first));
    }
    for (auto total: target_totals) {
      EXPECT_EQ(total.second, counts.GetTargetWordCount(total.first));
    }
    EXPECT_EQ(static_cast<int>(source_totals.size()),
              counts.GetSourceWordIndex().Size());
    EXPECT_EQ(static_cast<int>(target_totals.size()),
              counts.GetTargetWordIndex().Size());
  }

  ScoringConfig config;
  ScoringConfig fast_config;
};

TEST_F(CountAggregatorTest, TestPassNumbers) {
  CountAggregator exact_counts(config);
  EXPECT_EQ(2, exact_counts.GetRequiredPassNumber());
  EXPECT_EQ(0, exact_counts.GetCurrentPass());
  EXPECT_FALSE(exact_counts.IsFinalPass());
  exact_counts.StartPass(1);
  EXPECT_TRUE(exact_counts.IsFinalPass());
  EXPECT_THROW(exact_counts.StartPass(2), invalid_argument);

  CountAggregator fast_counts(fast_config);
  EXPECT_EQ(1, fast_counts.GetRequiredPassNumber());
  EXPECT_TRUE(fast_counts.IsFinalPass());
  EXPECT_THROW(fast_counts.StartPass(1), invalid_argument);
}

TEST_F(CountAggregatorTest, TestAlignedWords) {
  // a b / x y with links 0-0 1-1.
  int a = 1, b = 2, x = 3, y = 4;
  CountAggregator counts(fast_config);
  counts.CountSentence(SentencePair({a, b}, {x, y}, {{0, 0}, {1, 1}}));

  EXPECT_EQ(1, counts.GetWordPairCount(a, x));
  EXPECT_EQ(1, counts.GetWordPairCount(b, y));
  EXPECT_EQ(-1, counts.GetWordPairCount(a, y));
  EXPECT_EQ(1, counts.GetTargetWordCount(x));
  EXPECT_EQ(1, counts.GetTargetWordCount(y));
  EXPECT_EQ(1, counts.GetSourceWordCount(a));
  EXPECT_EQ(1, counts.GetSourceWordCount(b));
  EXPECT_EQ(-1, counts.GetSourceWordCount(NULL_WORD));
  EXPECT_EQ(-1, counts.GetTargetWordCount(NULL_WORD));
}

TEST_F(CountAggregatorTest, TestUnalignedWords) {
  // a b / x y z with a single link 0-0.
  int a = 1, b = 2, x = 3, y = 4, z = 5;
  CountAggregator counts(fast_config);
  counts.CountSentence(SentencePair({a, b}, {x, y, z}, {{0, 0}}));

  EXPECT_EQ(1, counts.GetWordPairCount(a, x));
  EXPECT_EQ(1, counts.GetWordPairCount(b, NULL_WORD));
  EXPECT_EQ(1, counts.GetWordPairCount(NULL_WORD, y));
  EXPECT_EQ(1, counts.GetWordPairCount(NULL_WORD, z));
  EXPECT_EQ(1, counts.GetSourceWordCount(b));
  EXPECT_EQ(1, counts.GetTargetWordCount(NULL_WORD));
  EXPECT_EQ(2, counts.GetSourceWordCount(NULL_WORD));
  EXPECT_EQ(1, counts.GetTargetWordCount(y));
  CheckMarginals(counts);
}

TEST_F(CountAggregatorTest, TestMultipleLinks) {
  // a b / x y with links 0-0 0-1 1-1.
  int a = 1, b = 2, x = 3, y = 4;
  CountAggregator counts(fast_config);
  counts.CountSentence(SentencePair({a, b}, {x, y}, {{0, 0}, {0, 1}, {1, 1}}));
  counts.CountSentence(SentencePair({a}, {y}, {{0, 0}}));

  EXPECT_EQ(2, counts.GetWordPairCount(a, y));
  EXPECT_EQ(3, counts.GetSourceWordCount(a));
  EXPECT_EQ(3, counts.GetTargetWordCount(y));
  EXPECT_EQ(-1, counts.GetTargetWordCount(NULL_WORD));
  CheckMarginals(counts);
}

TEST_F(CountAggregatorTest, TestRepeatedLinks) {
  // a b / x with links 0-0 0-0 1-0.
  int a = 1, b = 2, x = 3;
  SentencePair sentence({a, b}, {x}, {{0, 0}, {0, 0}, {1, 0}});
  vector<vector<int>> expected_f2e = {{0}, {0}};
  vector<vector<int>> expected_e2f = {{0, 1}};
  EXPECT_EQ(expected_f2e, sentence.f2e);
  EXPECT_EQ(expected_e2f, sentence.e2f);

  CountAggregator counts(fast_config);
  counts.CountSentence(sentence);
  EXPECT_EQ(1, counts.GetWordPairCount(a, x));
  EXPECT_EQ(1, counts.GetSourceWordCount(a));
  EXPECT_EQ(2, counts.GetTargetWordCount(x));
  CheckMarginals(counts);
}

TEST_F(CountAggregatorTest, TestMarginalsOnLargerCorpus) {
  vector<SentencePair> sentences;
  for (int i = 0; i < 50; ++i) {
    vector<int> source, target;
    vector<pair<int, int>> links;
    for (int j = 0; j < 6; ++j) {
      source.push_back(1 + (i * 7 + j) % 11);
      target.push_back(20 + (i * 3 + j * 5) % 13);
    }
    for (int j = 0; j < 6; ++j) {
      if ((i + j) % 3 != 0) {
        links.push_back(make_pair(j, (j + i) % 6));
      }
    }
    sentences.push_back(SentencePair(source, target, links));
  }

  CountAggregator counts(fast_config);
  counts.CountSentences(sentences, 4);
  CheckMarginals(counts);
}

TEST_F(CountAggregatorTest, TestPhraseCountsOnlyOnFinalPass) {
  CountAggregator counts(config);
  PhrasePair phrase_pair = MakePhrasePair(0, 0, 0);

  counts.StartPass(0);
  EXPECT_FALSE(counts.CountPhrase(phrase_pair));
  EXPECT_EQ(0, counts.GetPhrasePairCounts().Size());
  EXPECT_EQ(0, counts.GetSourcePhraseCounts().Size());
  EXPECT_EQ(0, counts.GetTargetPhraseCounts().Size());

  counts.StartPass(1);
  EXPECT_TRUE(counts.CountPhrase(phrase_pair));
  EXPECT_EQ(1, counts.GetPhrasePairCounts().Get(0));
  EXPECT_EQ(1, counts.GetSourcePhraseCounts().Get(0));
  EXPECT_EQ(1, counts.GetTargetPhraseCounts().Get(0));
}

TEST_F(CountAggregatorTest, TestFastModeCountsPhrasesOnFirstPass) {
  CountAggregator counts(fast_config);
  counts.StartPass(0);
  EXPECT_TRUE(counts.CountPhrase(MakePhrasePair(2, 1, 0)));
  EXPECT_EQ(3, counts.GetPhrasePairCounts().Size());
  EXPECT_EQ(1, counts.GetPhrasePairCounts().Get(2));
  EXPECT_EQ(0, counts.GetPhrasePairCounts().Get(0));
  EXPECT_EQ(1, counts.GetSourcePhraseCounts().Get(1));
}

TEST_F(CountAggregatorTest, TestDuplicatePairIds) {
  CountAggregator counts(config);
  counts.StartPass(1);
  counts.CountPhrase(MakePhrasePair(0, 0, 0));
  counts.CountPhrase(MakePhrasePair(0, 0, 0));
  counts.CountPhrase(MakePhrasePair(1, 0, 1));

  EXPECT_EQ(2, counts.GetPhrasePairCounts().Get(0));
  EXPECT_EQ(1, counts.GetPhrasePairCounts().Get(1));
  EXPECT_EQ(3, counts.GetSourcePhraseCounts().Get(0));
  EXPECT_EQ(2, counts.GetTargetPhraseCounts().Get(0));
  EXPECT_EQ(1, counts.GetTargetPhraseCounts().Get(1));
}

TEST_F(CountAggregatorTest, TestUnassignedIdsAreIgnored) {
  CountAggregator counts(fast_config);
  counts.CountPhrase(MakePhrasePair(-1, 0, -1));
  EXPECT_EQ(0, counts.GetPhrasePairCounts().Size());
  EXPECT_EQ(1, counts.GetSourcePhraseCounts().Get(0));
  EXPECT_EQ(0, counts.GetTargetPhraseCounts().Size());
}

TEST_F(CountAggregatorTest, TestWordCountsOnEveryPass) {
  int a = 1, x = 2;
  SentencePair sentence({a}, {x}, {{0, 0}});
  CountAggregator counts(config);
  counts.StartPass(0);
  counts.CountSentence(sentence);
  counts.StartPass(1);
  counts.CountSentence(sentence);

  EXPECT_EQ(2, counts.GetWordPairCount(a, x));
  EXPECT_EQ(2, counts.GetSourceWordCount(a));
  EXPECT_EQ(2, counts.GetTargetWordCount(x));
}

TEST_F(CountAggregatorTest, TestCountsDoNotDependOnThreads) {
  vector<SentencePair> sentences;
  vector<PhrasePair> phrase_pairs;
  for (int i = 0; i < 200; ++i) {
    sentences.push_back(SentencePair({1 + i % 5, 1 + i % 7}, {10 + i % 3},
                                     {{0, 0}}));
    phrase_pairs.push_back(MakePhrasePair(i % 17, i % 5, i % 3));
  }

  CountAggregator single_thread(config), multiple_threads(config);
  for (int pass = 0; pass < config.GetRequiredPassNumber(); ++pass) {
    single_thread.StartPass(pass);
    single_thread.CountSentences(sentences, 1);
    single_thread.CountPhrases(phrase_pairs, 1);
    multiple_threads.StartPass(pass);
    multiple_threads.CountSentences(sentences, 8);
    multiple_threads.CountPhrases(phrase_pairs, 8);
  }

  EXPECT_EQ(single_thread.GetPhrasePairCounts(),
            multiple_threads.GetPhrasePairCounts());
  EXPECT_EQ(single_thread.GetSourcePhraseCounts(),
            multiple_threads.GetSourcePhraseCounts());
  EXPECT_EQ(single_thread.GetTargetPhraseCounts(),
            multiple_threads.GetTargetPhraseCounts());
  EXPECT_EQ(200, single_thread.GetPhrasePairCounts().GetTotal());

  const TupleIndex& index = single_thread.GetWordPairIndex();
  EXPECT_EQ(index.Size(), multiple_threads.GetWordPairIndex().Size());
  for (int slot = 0; slot < index.Size(); ++slot) {
    vector<int> word_pair = index.Get(slot);
    EXPECT_EQ(single_thread.GetWordPairCount(word_pair[0], word_pair[1]),
              multiple_threads.GetWordPairCount(word_pair[0], word_pair[1]));
  }
  CheckMarginals(multiple_threads);
}

} // namespace
} // namespace ptstats
