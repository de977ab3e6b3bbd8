#include "max_lex_target_given_source.h"

#include <algorithm>
#include <cstdio>

#include "lexical_table.h"
#include "vocabulary.h"

namespace ptstats {
namespace features {

MaxLexTargetGivenSource::MaxLexTargetGivenSource(
    shared_ptr<LexicalTable> table, const ScoringConfig& config) :
    table(table), config(config) {}

double MaxLexTargetGivenSource::Score(const FeatureContext& context) const {
  const PhrasePair& phrase_pair = context.phrase_pair;
  vector<int> source_words = phrase_pair.source_symbols;
  source_words.push_back(Vocabulary::NULL_WORD);

  double score = 1.0;
  for (size_t j = 0; j < phrase_pair.target_symbols.size(); ++j) {
    double max_score = config.min_lex_prob;
    for (int source_word: source_words) {
      max_score = max(max_score, table->GetTargetGivenSourceScore(
          source_word, phrase_pair.target_symbols[j]));
    }
    if (config.debug_level >= 1) {
      #pragma omp critical (stderr_write)
      fprintf(stderr, "w(%s|...) = %.3f\n",
              phrase_pair.GetTargetWord(j).c_str(), max_score);
    }
    score *= max_score;
  }
  return score;
}

string MaxLexTargetGivenSource::GetName() const {
  return "MaxLexEgivenF";
}

} // namespace features
} // namespace ptstats
