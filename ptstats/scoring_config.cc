#include "scoring_config.h"

#include <iomanip>

namespace po = boost::program_options;

namespace ptstats {

const double ScoringConfig::MIN_LEX_PROB = 1e-5;
const double ScoringConfig::DEFAULT_PHI_FILTER = 1e-4;
const double ScoringConfig::DEFAULT_LEX_FILTER = 0;

ScoringConfig::ScoringConfig() :
    exact(true), ibm_lex_model(false), only_phi(false),
    phi_filter(DEFAULT_PHI_FILTER), lex_filter(DEFAULT_LEX_FILTER),
    min_lex_prob(MIN_LEX_PROB), debug_level(0), print_counts(false) {}

int ScoringConfig::GetRequiredPassNumber() const {
  return exact ? 2 : 1;
}

void AddScoringOptions(po::options_description* desc) {
  desc->add_options()
    ("exact", po::value<bool>()->default_value(true),
        "Collect phrase counts on a dedicated pass (exact phi denominators)")
    ("ibm_lex_model", po::value<bool>()->default_value(false),
        "Max based lexical weights (no phrase internal alignment needed)")
    ("only_phi", po::value<bool>()->default_value(false),
        "Output only the phrase translation probabilities")
    ("phi_filter",
        po::value<double>()->default_value(ScoringConfig::DEFAULT_PHI_FILTER),
        "Minimum phi(e|f) of a phrase pair")
    ("lex_filter",
        po::value<double>()->default_value(ScoringConfig::DEFAULT_LEX_FILTER),
        "Minimum lex(e|f) of a phrase pair")
    ("min_lex_prob",
        po::value<double>()->default_value(ScoringConfig::MIN_LEX_PROB),
        "Lexical weight used for words without any translation probability")
    ("debug", po::value<int>()->default_value(0),
        "Debug level (0-3)")
    ("print_counts", po::value<bool>()->default_value(false),
        "Append the raw phrase counts to the features");
}

ScoringConfig GetScoringConfig(const po::variables_map& vm) {
  ScoringConfig config;
  config.exact = vm["exact"].as<bool>();
  config.ibm_lex_model = vm["ibm_lex_model"].as<bool>();
  config.only_phi = vm["only_phi"].as<bool>();
  config.phi_filter = vm["phi_filter"].as<double>();
  config.lex_filter = vm["lex_filter"].as<double>();
  config.min_lex_prob = vm["min_lex_prob"].as<double>();
  config.debug_level = vm["debug"].as<int>();
  config.print_counts = vm["print_counts"].as<bool>();
  return config;
}

ostream& operator<<(ostream& os, const ScoringConfig& config) {
  os << boolalpha;
  os << "Exact denominator counts for phi(f|e): " << config.exact << endl;
  os << "Max based lexical weights: " << config.ibm_lex_model << endl;
  os << fixed << setprecision(5);
  os << "Cut-off value for phi(e|f): " << config.phi_filter << endl;
  os << "Cut-off value for lex(e|f): " << config.lex_filter << endl;
  os.unsetf(ios_base::floatfield);
  os << noboolalpha << setprecision(6);
  return os;
}

} // namespace ptstats
