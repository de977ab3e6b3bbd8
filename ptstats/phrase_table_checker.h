#ifndef _PHRASE_TABLE_CHECKER_H_
#define _PHRASE_TABLE_CHECKER_H_

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "scoring_config.h"

using namespace std;

namespace ptstats {

class PhraseIndex;
class PhrasePairBuilder;
class PhraseScorer;

/**
 * Thrown when a line of the reference phrase table can't be parsed.
 */
class PhraseTableFormatError : public runtime_error {
 public:
  PhraseTableFormatError(const string& message, const string& line,
                         int line_number);

  const string& GetLine() const;

  int GetLineNumber() const;

 private:
  string line;
  int line_number;
};

/**
 * Statistics of a comparison against a reference phrase table.
 */
struct CheckSummary {
  CheckSummary();

  int num_lines;
  int num_features;
  int num_mismatches;
  int num_rejected;
};

ostream& operator<<(ostream& os, const CheckSummary& summary);

/**
 * Compares our features with the ones of a reference phrase table.
 *
 * Every line of the reference table must have five fields separated by |||:
 * source phrase, target phrase, source alignment, target alignment and
 * feature values. The phrase pair is rebuilt from the first three fields,
 * registered in the phrase index (which may assign it new ids) and scored.
 * Features whose relative error exceeds MAX_RELATIVE_ERROR are reported on
 * stderr.
 */
class PhraseTableChecker {
 public:
  static const double MAX_RELATIVE_ERROR;

  PhraseTableChecker(shared_ptr<PhraseScorer> scorer,
                     shared_ptr<PhrasePairBuilder> phrase_pair_builder,
                     shared_ptr<PhraseIndex> phrase_index,
                     const ScoringConfig& config);

  virtual ~PhraseTableChecker();

  // Checks every line of the reference phrase table. Throws
  // PhraseTableFormatError on the first malformed line.
  CheckSummary Check(istream& reference) const;

  // Checks the reference phrase table stored in the given file. Returns false
  // if the file can't be read or has a malformed line.
  bool CheckFile(const string& filename, CheckSummary* summary) const;

  // Returns 1 - reference / computed.
  static double GetRelativeError(double reference, double computed);

 private:
  shared_ptr<PhraseScorer> scorer;
  shared_ptr<PhrasePairBuilder> phrase_pair_builder;
  shared_ptr<PhraseIndex> phrase_index;
  ScoringConfig config;
};

} // namespace ptstats

#endif
