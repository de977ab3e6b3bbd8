#include "max_lex_source_given_target.h"

#include <algorithm>
#include <cstdio>

#include "lexical_table.h"
#include "vocabulary.h"

namespace ptstats {
namespace features {

MaxLexSourceGivenTarget::MaxLexSourceGivenTarget(
    shared_ptr<LexicalTable> table, const ScoringConfig& config) :
    table(table), config(config) {}

double MaxLexSourceGivenTarget::Score(const FeatureContext& context) const {
  const PhrasePair& phrase_pair = context.phrase_pair;
  vector<int> target_words = phrase_pair.target_symbols;
  target_words.push_back(Vocabulary::NULL_WORD);

  double score = 1.0;
  for (size_t i = 0; i < phrase_pair.source_symbols.size(); ++i) {
    double max_score = config.min_lex_prob;
    for (int target_word: target_words) {
      max_score = max(max_score, table->GetSourceGivenTargetScore(
          phrase_pair.source_symbols[i], target_word));
    }
    if (config.debug_level >= 1) {
      #pragma omp critical (stderr_write)
      fprintf(stderr, "w(%s|...) = %.3f\n",
              phrase_pair.GetSourceWord(i).c_str(), max_score);
    }
    score *= max_score;
  }
  return score;
}

string MaxLexSourceGivenTarget::GetName() const {
  return "MaxLexFgivenE";
}

} // namespace features
} // namespace ptstats
