#ifndef _COUNT_AGGREGATOR_H_
#define _COUNT_AGGREGATOR_H_

#include <vector>

#include "count_vector.h"
#include "scoring_config.h"
#include "tuple_index.h"

using namespace std;

namespace ptstats {

struct PhrasePair;
struct SentencePair;

/**
 * Collects the word and phrase counts needed to score phrase pairs.
 *
 * Word counts c(f, e), c(f) and c(e) are collected from every sentence pair on
 * every pass. Word pairs and words are mapped to dense slots by the word
 * indexes. Unaligned words are counted as aligned to the NULL word.
 *
 * Phrase counts c(f, e), c(f) and c(e) are only collected on the final pass
 * and are stored under the ids assigned by the phrase collector. In exact mode
 * the first pass is left to the collector for assigning ids, so the phrase
 * counts of the second pass cover the whole corpus.
 *
 * Each count vector and each index is guarded by its own critical section, so
 * several threads can count disjoint parts of the corpus. Read access is only
 * safe after all the counting threads are done.
 */
class CountAggregator {
 public:
  CountAggregator(const ScoringConfig& config);

  virtual ~CountAggregator();

  // Returns the number of passes over the corpus.
  int GetRequiredPassNumber() const;

  // Marks the beginning of the given pass (0 based).
  void StartPass(int pass);

  int GetCurrentPass() const;

  // Checks if phrase counts are collected in the current pass.
  bool IsFinalPass() const;

  // Counts the aligned word pairs in a sentence pair. Unaligned source words
  // are counted as (f, NULL) and unaligned target words as (NULL, e).
  void CountSentence(const SentencePair& sentence);

  // Counts a set of sentence pairs using the given number of threads.
  void CountSentences(const vector<SentencePair>& sentences, int num_threads);

  // Increments c(f, e), c(f) and c(e) for a pair of words.
  void AddWordPairCount(int source_word, int target_word);

  // Increments the phrase counts of a phrase pair if this is the final pass.
  // Returns true if the counts were incremented.
  bool CountPhrase(const PhrasePair& phrase_pair);

  // Counts a set of phrase pairs using the given number of threads.
  void CountPhrases(const vector<PhrasePair>& phrase_pairs, int num_threads);

  // Returns c(f, e) for a pair of words or -1 if the pair was never counted.
  int GetWordPairCount(int source_word, int target_word) const;

  // Returns c(f) for a source word or -1 if the word was never counted.
  int GetSourceWordCount(int source_word) const;

  // Returns c(e) for a target word or -1 if the word was never counted.
  int GetTargetWordCount(int target_word) const;

  const CountVector& GetPhrasePairCounts() const;

  const CountVector& GetSourcePhraseCounts() const;

  const CountVector& GetTargetPhraseCounts() const;

  const CountVector& GetWordPairCounts() const;

  const CountVector& GetSourceWordCounts() const;

  const CountVector& GetTargetWordCounts() const;

  const TupleIndex& GetWordPairIndex() const;

  const WordIndex& GetSourceWordIndex() const;

  const WordIndex& GetTargetWordIndex() const;

 private:
  ScoringConfig config;
  int current_pass;

  TupleIndex word_pair_index;
  WordIndex source_word_index;
  WordIndex target_word_index;

  CountVector phrase_pair_counts;
  CountVector source_phrase_counts;
  CountVector target_phrase_counts;
  CountVector word_pair_counts;
  CountVector source_word_counts;
  CountVector target_word_counts;
};

} // namespace ptstats

#endif
