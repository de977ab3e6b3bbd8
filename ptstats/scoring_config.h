#ifndef _SCORING_CONFIG_H_
#define _SCORING_CONFIG_H_

#include <iostream>

#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>

using namespace std;

namespace ptstats {

/**
 * Settings shared by the counting and the scoring components.
 *
 * A configuration is built once at start up and passed by value to every
 * component that needs it.
 */
struct ScoringConfig {
  static const double MIN_LEX_PROB;
  static const double DEFAULT_PHI_FILTER;
  static const double DEFAULT_LEX_FILTER;

  ScoringConfig();

  // Returns the number of passes over the corpus: 2 when the phrase counts
  // must be exact, 1 otherwise.
  int GetRequiredPassNumber() const;

  // Phrase counts are collected on a dedicated final pass.
  bool exact;
  // Use the max based lexical weights instead of the link averaged ones.
  bool ibm_lex_model;
  // Emit only the phrase translation probabilities.
  bool only_phi;
  // Phrase pairs with phi(e|f) below this value are discarded.
  double phi_filter;
  // Phrase pairs with lex(e|f) below this value are discarded.
  double lex_filter;
  // Replaces null word translation probabilities in lexical weights.
  double min_lex_prob;
  // 0 is quiet, 1 logs lexical weights, 2 logs phrase pairs, 3 logs counts.
  int debug_level;
  // Append the raw counts to the phrase probabilities and lexical weights.
  bool print_counts;
};

// Adds the scoring options to a command line options description.
void AddScoringOptions(boost::program_options::options_description* desc);

// Reads the scoring options from parsed command line options.
ScoringConfig GetScoringConfig(const boost::program_options::variables_map& vm);

ostream& operator<<(ostream& os, const ScoringConfig& config);

} // namespace ptstats

#endif
