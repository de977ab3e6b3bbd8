#include "phrase_scorer.h"

#include <iostream>

#include "count_aggregator.h"
#include "features/feature.h"
#include "features/lex_source_given_target.h"
#include "features/lex_target_given_source.h"
#include "features/max_lex_source_given_target.h"
#include "features/max_lex_target_given_source.h"
#include "features/phi_source_given_target.h"
#include "features/phi_target_given_source.h"
#include "lexical_table.h"
#include "phrase_pair.h"

namespace ptstats {

using namespace features;

PhraseScorer::PhraseScorer(
    shared_ptr<CountAggregator> counts,
    shared_ptr<Feature> lex_source_given_target,
    shared_ptr<Feature> lex_target_given_source,
    const ScoringConfig& config) :
    counts(counts),
    phi_source_given_target(make_shared<PhiSourceGivenTarget>()),
    phi_target_given_source(make_shared<PhiTargetGivenSource>()),
    lex_source_given_target(lex_source_given_target),
    lex_target_given_source(lex_target_given_source),
    config(config) {}

PhraseScorer::PhraseScorer() {}

PhraseScorer::~PhraseScorer() {}

bool PhraseScorer::Score(const PhrasePair& phrase_pair,
                         vector<double>* scores) const {
  scores->clear();
  const CountVector& pair_counts = counts->GetPhrasePairCounts();
  const CountVector& source_counts = counts->GetSourcePhraseCounts();
  const CountVector& target_counts = counts->GetTargetPhraseCounts();
  // Pairs indexed by the collector, but never counted on the final pass.
  if (!pair_counts.Contains(phrase_pair.pair_id) ||
      !source_counts.Contains(phrase_pair.source_id) ||
      !target_counts.Contains(phrase_pair.target_id) ||
      pair_counts.Get(phrase_pair.pair_id) == 0 ||
      source_counts.Get(phrase_pair.source_id) == 0 ||
      target_counts.Get(phrase_pair.target_id) == 0) {
    #pragma omp critical (stderr_write)
    cerr << "Can't get translation features for phrase pair: " << phrase_pair
         << " (ids " << phrase_pair.pair_id << " " << phrase_pair.source_id
         << " " << phrase_pair.target_id << ")" << endl;
    return false;
  }

  double pair_count = pair_counts.Get(phrase_pair.pair_id);
  double source_count = source_counts.Get(phrase_pair.source_id);
  double target_count = target_counts.Get(phrase_pair.target_id);
  FeatureContext context(phrase_pair, pair_count, source_count, target_count);

  double phi_f_e = phi_source_given_target->Score(context);
  double phi_e_f = phi_target_given_source->Score(context);
  if (config.phi_filter > phi_e_f) {
    return false;
  }

  double lex_f_e = lex_source_given_target->Score(context);
  double lex_e_f = lex_target_given_source->Score(context);
  if (config.lex_filter > lex_e_f) {
    return false;
  }

  if (config.print_counts) {
    *scores = {phi_f_e, lex_f_e, phi_e_f, lex_e_f,
               pair_count, target_count, source_count};
  } else if (config.only_phi) {
    *scores = {phi_f_e, phi_e_f};
  } else {
    *scores = {phi_f_e, lex_f_e, phi_e_f, lex_e_f};
  }
  return true;
}

vector<string> PhraseScorer::GetFeatureNames() const {
  if (config.print_counts) {
    return {phi_source_given_target->GetName(),
            lex_source_given_target->GetName(),
            phi_target_given_source->GetName(),
            lex_target_given_source->GetName(),
            "CountFE", "CountE", "CountF"};
  } else if (config.only_phi) {
    return {phi_source_given_target->GetName(),
            phi_target_given_source->GetName()};
  }
  return {phi_source_given_target->GetName(),
          lex_source_given_target->GetName(),
          phi_target_given_source->GetName(),
          lex_target_given_source->GetName()};
}

shared_ptr<PhraseScorer> CreatePhraseScorer(shared_ptr<CountAggregator> counts,
                                            const ScoringConfig& config) {
  shared_ptr<LexicalTable> table = make_shared<LexicalTable>(counts);
  shared_ptr<Feature> lex_source_given_target, lex_target_given_source;
  if (config.ibm_lex_model) {
    lex_source_given_target =
        make_shared<MaxLexSourceGivenTarget>(table, config);
    lex_target_given_source =
        make_shared<MaxLexTargetGivenSource>(table, config);
  } else {
    lex_source_given_target = make_shared<LexSourceGivenTarget>(table, config);
    lex_target_given_source = make_shared<LexTargetGivenSource>(table, config);
  }
  return make_shared<PhraseScorer>(counts, lex_source_given_target,
                                   lex_target_given_source, config);
}

} // namespace ptstats
