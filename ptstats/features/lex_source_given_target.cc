#include "lex_source_given_target.h"

#include <cstdio>

#include "lexical_table.h"
#include "vocabulary.h"

namespace ptstats {
namespace features {

LexSourceGivenTarget::LexSourceGivenTarget(shared_ptr<LexicalTable> table,
                                           const ScoringConfig& config) :
    table(table), config(config) {}

double LexSourceGivenTarget::Score(const FeatureContext& context) const {
  const PhrasePair& phrase_pair = context.phrase_pair;
  if (config.debug_level >= 1) {
    #pragma omp critical (stderr_write)
    cerr << "Computing p(f|e) for phrase pair: " << phrase_pair << endl;
  }

  double lex = 1.0;
  for (size_t i = 0; i < phrase_pair.source_symbols.size(); ++i) {
    int source_word = phrase_pair.source_symbols[i];
    if (source_word < 0) {
      continue;
    }

    double weight = 0;
    const vector<int>& links = phrase_pair.f2e[i];
    if (links.empty()) {
      weight = table->GetSourceGivenTargetScore(source_word,
                                                Vocabulary::NULL_WORD);
    } else {
      for (int j: links) {
        weight += table->GetSourceGivenTargetScore(
            source_word, phrase_pair.target_symbols[j]);
      }
      weight /= links.size();
    }

    if (config.debug_level >= 1 || weight == 0) {
      #pragma omp critical (stderr_write)
      {
        fprintf(stderr, "w(%s|...) = %.3f\n",
                phrase_pair.GetSourceWord(i).c_str(), weight);
        if (weight == 0) {
          cerr << "  WARNING: wsum = " << weight << endl;
        }
      }
    }
    if (weight == 0) {
      weight = config.min_lex_prob;
    }
    lex *= weight;
  }
  return lex;
}

string LexSourceGivenTarget::GetName() const {
  return "LexFgivenE";
}

} // namespace features
} // namespace ptstats
