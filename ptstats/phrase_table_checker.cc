#include "phrase_table_checker.h"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <vector>

#include "phrase_index.h"
#include "phrase_pair.h"
#include "phrase_pair_builder.h"
#include "phrase_scorer.h"
#include "string_util.h"

namespace ptstats {

namespace {

const size_t NUM_FIELDS = 5;

string GetScoresString(const vector<double>& scores) {
  ostringstream os;
  os << "[";
  for (size_t i = 0; i < scores.size(); ++i) {
    if (i > 0) {
      os << ", ";
    }
    os << scores[i];
  }
  os << "]";
  return os.str();
}

} // namespace

PhraseTableFormatError::PhraseTableFormatError(const string& message,
                                               const string& line,
                                               int line_number) :
    runtime_error(message + " at line " + to_string(line_number) + ": " +
                  line),
    line(line), line_number(line_number) {}

const string& PhraseTableFormatError::GetLine() const {
  return line;
}

int PhraseTableFormatError::GetLineNumber() const {
  return line_number;
}

CheckSummary::CheckSummary() :
    num_lines(0), num_features(0), num_mismatches(0), num_rejected(0) {}

ostream& operator<<(ostream& os, const CheckSummary& summary) {
  return os << "Checked " << summary.num_lines << " phrase pairs, "
            << summary.num_features << " features, "
            << summary.num_mismatches << " different, "
            << summary.num_rejected << " rejected";
}

const double PhraseTableChecker::MAX_RELATIVE_ERROR = 1e-2;

PhraseTableChecker::PhraseTableChecker(
    shared_ptr<PhraseScorer> scorer,
    shared_ptr<PhrasePairBuilder> phrase_pair_builder,
    shared_ptr<PhraseIndex> phrase_index,
    const ScoringConfig& config) :
    scorer(scorer), phrase_pair_builder(phrase_pair_builder),
    phrase_index(phrase_index), config(config) {}

PhraseTableChecker::~PhraseTableChecker() {}

CheckSummary PhraseTableChecker::Check(istream& reference) const {
  CheckSummary summary;
  string line;
  int line_number = 0;
  try {
    while (getline(reference, line)) {
      ++line_number;
      if (line.empty()) {
        continue;
      }

      vector<string> fields = SplitFields(line);
      if (fields.size() != NUM_FIELDS) {
        throw PhraseTableFormatError("Expecting five fields in phrase table, "
            "found: " + to_string(fields.size()), line, line_number);
      }

      PhrasePair phrase_pair;
      vector<double> reference_scores;
      try {
        phrase_pair = phrase_pair_builder->Build(fields[0], fields[1],
                                                 fields[2]);
        for (const string& value: Tokenize(fields[4])) {
          reference_scores.push_back(stod(value));
        }
      } catch (const logic_error& e) {
        throw PhraseTableFormatError(e.what(), line, line_number);
      }
      ++summary.num_lines;

      phrase_index->AddToIndex(&phrase_pair);
      vector<double> scores;
      if (!scorer->Score(phrase_pair, &scores)) {
        ++summary.num_rejected;
        cerr << "Phrase pair rejected by our model: " << phrase_pair << endl;
        cerr << "Features from reference phrase table: " << fields[4] << endl;
        continue;
      }

      for (size_t i = 0; i < reference_scores.size(); ++i) {
        if (i >= scores.size()) {
          cerr << "No feature " << i << " in our model for: " << phrase_pair
               << endl;
          continue;
        }
        ++summary.num_features;
        double error = GetRelativeError(reference_scores[i], scores[i]);
        if (!(fabs(error) <= MAX_RELATIVE_ERROR)) {
          ++summary.num_mismatches;
          fprintf(stderr, "Different score for feature %d : %.3f != %.3f\n",
                  static_cast<int>(i), reference_scores[i], scores[i]);
          cerr << "Phrase from reference phrase table: " << fields[0]
               << " ||| " << fields[1] << " ||| " << fields[2] << " ||| "
               << fields[3] << endl;
          cerr << "Phrase from our model: " << phrase_pair << endl;
          cerr << "Features from reference phrase table: " << fields[4]
               << endl;
          cerr << "Features from our computation: "
               << GetScoresString(scores) << endl;
        } else if (config.debug_level >= 2) {
          fprintf(stderr, "Same score for feature %d : %.3f\n",
                  static_cast<int>(i), reference_scores[i]);
        }
      }
    }
  } catch (const ios_base::failure& e) {
    cerr << "Error reading reference phrase table after line " << line_number
         << ": " << e.what() << endl;
    throw;
  }
  return summary;
}

bool PhraseTableChecker::CheckFile(const string& filename,
                                   CheckSummary* summary) const {
  ifstream reference(filename.c_str());
  if (!reference) {
    cerr << "Can't open reference phrase table: " << filename << endl;
    return false;
  }
  reference.exceptions(ios_base::badbit);
  try {
    *summary = Check(reference);
  } catch (const ios_base::failure& e) {
    cerr << "Checking against " << filename << " aborted: " << e.what()
         << endl;
    return false;
  } catch (const PhraseTableFormatError& e) {
    cerr << "Checking against " << filename << " aborted: " << e.what()
         << endl;
    return false;
  }
  return true;
}

double PhraseTableChecker::GetRelativeError(double reference,
                                            double computed) {
  return 1 - reference / computed;
}

} // namespace ptstats
