#include "lex_target_given_source.h"

#include <cstdio>

#include "lexical_table.h"
#include "vocabulary.h"

namespace ptstats {
namespace features {

LexTargetGivenSource::LexTargetGivenSource(shared_ptr<LexicalTable> table,
                                           const ScoringConfig& config) :
    table(table), config(config) {}

double LexTargetGivenSource::Score(const FeatureContext& context) const {
  const PhrasePair& phrase_pair = context.phrase_pair;
  if (config.debug_level >= 1) {
    #pragma omp critical (stderr_write)
    cerr << "Computing p(e|f) for phrase pair: " << phrase_pair << endl;
  }

  double lex = 1.0;
  for (size_t j = 0; j < phrase_pair.target_symbols.size(); ++j) {
    int target_word = phrase_pair.target_symbols[j];
    if (target_word < 0) {
      continue;
    }

    double weight = 0;
    const vector<int>& links = phrase_pair.e2f[j];
    if (links.empty()) {
      weight = table->GetTargetGivenSourceScore(Vocabulary::NULL_WORD,
                                                target_word);
    } else {
      for (int i: links) {
        weight += table->GetTargetGivenSourceScore(
            phrase_pair.source_symbols[i], target_word);
      }
      weight /= links.size();
    }

    if (config.debug_level >= 1 || weight == 0) {
      #pragma omp critical (stderr_write)
      fprintf(stderr, "w(%s|...) = %.3f\n",
              phrase_pair.GetTargetWord(j).c_str(), weight);
    }
    if (weight == 0) {
      weight = config.min_lex_prob;
    }
    lex *= weight;
  }
  return lex;
}

string LexTargetGivenSource::GetName() const {
  return "LexEgivenF";
}

} // namespace features
} // namespace ptstats
