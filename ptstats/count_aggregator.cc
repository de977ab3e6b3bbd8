#include "count_aggregator.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include "phrase_pair.h"
#include "sentence_pair.h"
#include "vocabulary.h"

namespace ptstats {

CountAggregator::CountAggregator(const ScoringConfig& config) :
    config(config), current_pass(0), word_pair_index(2) {}

CountAggregator::~CountAggregator() {}

int CountAggregator::GetRequiredPassNumber() const {
  return config.GetRequiredPassNumber();
}

void CountAggregator::StartPass(int pass) {
  if (pass < 0 || pass >= GetRequiredPassNumber()) {
    throw invalid_argument("Pass " + to_string(pass) + " is outside of [0, " +
                           to_string(GetRequiredPassNumber()) + ")");
  }
  current_pass = pass;
}

int CountAggregator::GetCurrentPass() const {
  return current_pass;
}

bool CountAggregator::IsFinalPass() const {
  return current_pass + 1 == GetRequiredPassNumber();
}

void CountAggregator::CountSentence(const SentencePair& sentence) {
  for (size_t i = 0; i < sentence.source.size(); ++i) {
    for (int j: sentence.f2e[i]) {
      AddWordPairCount(sentence.source[i], sentence.target[j]);
    }
    if (sentence.f2e[i].empty()) {
      AddWordPairCount(sentence.source[i], Vocabulary::NULL_WORD);
    }
  }

  for (size_t j = 0; j < sentence.target.size(); ++j) {
    if (sentence.e2f[j].empty()) {
      AddWordPairCount(Vocabulary::NULL_WORD, sentence.target[j]);
    }
  }
}

void CountAggregator::CountSentences(const vector<SentencePair>& sentences,
                                     int num_threads) {
  #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
  for (size_t i = 0; i < sentences.size(); ++i) {
    CountSentence(sentences[i]);
  }
}

void CountAggregator::AddWordPairCount(int source_word, int target_word) {
  vector<int> key = {source_word, target_word};
  int pair_slot, source_slot, target_slot;
  #pragma omp critical (word_pair_index)
  pair_slot = word_pair_index.IndexOf(key, true);
  #pragma omp critical (source_word_index)
  source_slot = source_word_index.IndexOf(source_word, true);
  #pragma omp critical (target_word_index)
  target_slot = target_word_index.IndexOf(target_word, true);

  #pragma omp critical (word_pair_counts)
  word_pair_counts.Increment(pair_slot);
  #pragma omp critical (source_word_counts)
  source_word_counts.Increment(source_slot);
  #pragma omp critical (target_word_counts)
  target_word_counts.Increment(target_slot);

  if (config.debug_level >= 3) {
    #pragma omp critical (stderr_write)
    cerr << "Adding lexical alignment count: c(f=" << source_word << ", e="
         << target_word << ") slots=" << pair_slot << "," << source_slot
         << "," << target_slot << endl;
  }
}

bool CountAggregator::CountPhrase(const PhrasePair& phrase_pair) {
  if (!IsFinalPass()) {
    return false;
  }

  if (config.debug_level >= 2) {
    #pragma omp critical (stderr_write)
    {
      cerr << "Adding phrase to table: " << phrase_pair.GetSourceString()
           << " -> " << phrase_pair.GetTargetString() << endl;
      cerr << "Assigned IDs: key=" << phrase_pair.pair_id << " fKey="
           << phrase_pair.source_id << " eKey=" << phrase_pair.target_id
           << endl;
    }
  }

  #pragma omp critical (phrase_pair_counts)
  phrase_pair_counts.Increment(phrase_pair.pair_id);
  #pragma omp critical (source_phrase_counts)
  source_phrase_counts.Increment(phrase_pair.source_id);
  #pragma omp critical (target_phrase_counts)
  target_phrase_counts.Increment(phrase_pair.target_id);
  return true;
}

void CountAggregator::CountPhrases(const vector<PhrasePair>& phrase_pairs,
                                   int num_threads) {
  #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
  for (size_t i = 0; i < phrase_pairs.size(); ++i) {
    CountPhrase(phrase_pairs[i]);
  }
}

int CountAggregator::GetWordPairCount(int source_word,
                                      int target_word) const {
  vector<int> key = {source_word, target_word};
  int slot = word_pair_index.Find(key);
  return slot < 0 ? -1 : word_pair_counts.Get(slot);
}

int CountAggregator::GetSourceWordCount(int source_word) const {
  int slot = source_word_index.Find(source_word);
  return slot < 0 ? -1 : source_word_counts.Get(slot);
}

int CountAggregator::GetTargetWordCount(int target_word) const {
  int slot = target_word_index.Find(target_word);
  return slot < 0 ? -1 : target_word_counts.Get(slot);
}

const CountVector& CountAggregator::GetPhrasePairCounts() const {
  return phrase_pair_counts;
}

const CountVector& CountAggregator::GetSourcePhraseCounts() const {
  return source_phrase_counts;
}

const CountVector& CountAggregator::GetTargetPhraseCounts() const {
  return target_phrase_counts;
}

const CountVector& CountAggregator::GetWordPairCounts() const {
  return word_pair_counts;
}

const CountVector& CountAggregator::GetSourceWordCounts() const {
  return source_word_counts;
}

const CountVector& CountAggregator::GetTargetWordCounts() const {
  return target_word_counts;
}

const TupleIndex& CountAggregator::GetWordPairIndex() const {
  return word_pair_index;
}

const WordIndex& CountAggregator::GetSourceWordIndex() const {
  return source_word_index;
}

const WordIndex& CountAggregator::GetTargetWordIndex() const {
  return target_word_index;
}

} // namespace ptstats
