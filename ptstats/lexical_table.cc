#include "lexical_table.h"

#include "count_aggregator.h"

namespace ptstats {

LexicalTable::LexicalTable(shared_ptr<CountAggregator> counts) :
    counts(counts) {}

LexicalTable::LexicalTable() {}

LexicalTable::~LexicalTable() {}

double LexicalTable::GetSourceGivenTargetScore(int source_word,
                                               int target_word) const {
  int pair_count = counts->GetWordPairCount(source_word, target_word);
  int target_count = counts->GetTargetWordCount(target_word);
  if (pair_count <= 0 || target_count <= 0) {
    return 0;
  }
  return 1.0 * pair_count / target_count;
}

double LexicalTable::GetTargetGivenSourceScore(int source_word,
                                               int target_word) const {
  int pair_count = counts->GetWordPairCount(source_word, target_word);
  int source_count = counts->GetSourceWordCount(source_word);
  if (pair_count <= 0 || source_count <= 0) {
    return 0;
  }
  return 1.0 * pair_count / source_count;
}

} // namespace ptstats
