#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/variables_map.hpp>
#if HAVE_OPEN_MP
#include <omp.h>
#else
  const unsigned omp_get_num_threads() { return 1; }
#endif

#include "alignment.h"
#include "count_aggregator.h"
#include "parallel_corpus.h"
#include "phrase_index.h"
#include "phrase_pair.h"
#include "phrase_pair_builder.h"
#include "phrase_scorer.h"
#include "phrase_table_checker.h"
#include "scoring_config.h"
#include "time_util.h"
#include "vocabulary.h"

namespace fs = boost::filesystem;
namespace po = boost::program_options;
using namespace std;
using namespace ptstats;

// Opens an input file, failing with a readable message if it doesn't exist.
void OpenInput(const string& filename, ifstream* input) {
  if (!fs::is_regular_file(filename)) {
    throw runtime_error("No such file: " + filename);
  }
  input->open(filename.c_str());
  if (!*input) {
    throw runtime_error("Can't open file: " + filename);
  }
}

// Reads the phrase pair occurrences produced by the phrase collector, one
// "source ||| target ||| alignment" per line.
vector<PhrasePair> ReadPhrasePairs(const string& filename,
                                   PhrasePairBuilder& builder) {
  ifstream input;
  OpenInput(filename, &input);
  vector<PhrasePair> phrase_pairs;
  string line;
  int line_number = 0;
  while (getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    try {
      phrase_pairs.push_back(builder.Parse(line));
    } catch (const invalid_argument& e) {
      throw runtime_error(filename + ":" + to_string(line_number) + ": " +
                          e.what());
    }
  }
  return phrase_pairs;
}

int main(int argc, char** argv) {
  // Sets up the command line arguments map.
  int max_threads = 1;
  #pragma omp parallel
  max_threads = omp_get_num_threads();
  string threads_option = "Number of parallel threads for counting and "
                          "scoring (max=" + to_string(max_threads) + ")";
  po::options_description desc("Command line options");
  desc.add_options()
    ("help,h", "Show available options")
    ("config,c", po::value<string>(), "Configuration file (key = value)")
    ("source,f", po::value<string>(), "Source language corpus")
    ("target,e", po::value<string>(), "Target language corpus")
    ("bitext,b", po::value<string>(), "Parallel text (source ||| target)")
    ("alignment,a", po::value<string>()->required(), "Bitext word alignment")
    ("phrases,p", po::value<string>()->required(),
        "Phrase pair occurrences (source ||| target ||| alignment)")
    ("threads,t", po::value<int>()->default_value(1), threads_option.c_str())
    ("check", po::value<string>(),
        "Compare the features with the ones of a reference phrase table");
  AddScoringOptions(&desc);

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);

    // Checks for the help option before calling notify, so we don't get an
    // exception for missing required arguments.
    if (vm.count("help")) {
      cout << desc << endl;
      return 0;
    }

    // Options given on the command line take precedence over the ones in the
    // configuration file.
    if (vm.count("config")) {
      ifstream config_file;
      OpenInput(vm["config"].as<string>(), &config_file);
      po::store(po::parse_config_file(config_file, desc), vm);
    }
    po::notify(vm);
  } catch (const exception& e) {
    cerr << e.what() << endl;
    cerr << desc << endl;
    return 1;
  }

  if (!((vm.count("source") && vm.count("target")) || vm.count("bitext"))) {
    cerr << "A parallel corpus is required. "
         << "Use -f (source) with -e (target) or -b (bitext)."
         << endl;
    return 1;
  }

  int num_threads = vm["threads"].as<int>();
  cerr << "Phrase scoring will use " << num_threads << " threads." << endl;
  ScoringConfig config = GetScoringConfig(vm);
  cerr << config;

  try {
    shared_ptr<Vocabulary> vocabulary = make_shared<Vocabulary>();

    // Reads the word aligned parallel corpus.
    StageTimer timer;
    cerr << "Reading parallel corpus and alignment..." << endl;
    ifstream alignment_file;
    OpenInput(vm["alignment"].as<string>(), &alignment_file);
    Alignment alignment(alignment_file);
    ParallelCorpus corpus(vocabulary);
    if (vm.count("bitext")) {
      ifstream bitext;
      OpenInput(vm["bitext"].as<string>(), &bitext);
      corpus.ReadBitext(bitext, alignment);
    } else {
      ifstream source, target;
      OpenInput(vm["source"].as<string>(), &source);
      OpenInput(vm["target"].as<string>(), &target);
      corpus.Read(source, target, alignment);
    }
    cerr << "Reading " << corpus.GetNumSentences() << " sentence pairs took "
         << timer.GetElapsedSeconds() << " seconds" << endl;

    // Reads the phrase pairs found by the phrase collector.
    timer.Restart();
    cerr << "Reading phrase pairs..." << endl;
    shared_ptr<PhrasePairBuilder> phrase_pair_builder =
        make_shared<PhrasePairBuilder>(vocabulary);
    vector<PhrasePair> phrase_pairs =
        ReadPhrasePairs(vm["phrases"].as<string>(), *phrase_pair_builder);
    cerr << "Reading " << phrase_pairs.size() << " phrase pairs took "
         << timer.GetElapsedSeconds() << " seconds" << endl;

    // Counts words on every pass. Phrase ids are assigned on the first pass
    // and phrases are counted on the last one (possibly the same).
    shared_ptr<CountAggregator> counts = make_shared<CountAggregator>(config);
    shared_ptr<PhraseIndex> phrase_index = make_shared<PhraseIndex>();
    int num_passes = counts->GetRequiredPassNumber();
    for (int pass = 0; pass < num_passes; ++pass) {
      timer.Restart();
      cerr << "Pass " << pass + 1 << " of " << num_passes << "..." << endl;
      counts->StartPass(pass);
      counts->CountSentences(corpus.GetSentences(), num_threads);
      if (pass == 0) {
        #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
        for (size_t i = 0; i < phrase_pairs.size(); ++i) {
          phrase_index->AddToIndex(&phrase_pairs[i]);
        }
      }
      counts->CountPhrases(phrase_pairs, num_threads);
      cerr << "Pass " << pass + 1 << " took "
           << timer.GetElapsedSeconds() << " seconds" << endl;
    }
    cerr << phrase_index->GetNumPairs() << " distinct phrase pairs, "
         << counts->GetWordPairIndex().Size() << " distinct word pairs"
         << endl;

    // Scores every distinct phrase pair once, using its first occurrence.
    timer.Restart();
    cerr << "Scoring phrase pairs..." << endl;
    vector<int> occurrences(phrase_index->GetNumPairs(), -1);
    for (size_t i = 0; i < phrase_pairs.size(); ++i) {
      if (occurrences[phrase_pairs[i].pair_id] == -1) {
        occurrences[phrase_pairs[i].pair_id] = i;
      }
    }
    shared_ptr<PhraseScorer> scorer = CreatePhraseScorer(counts, config);
    vector<vector<double>> scores(occurrences.size());
    vector<char> accepted(occurrences.size(), 0);
    #pragma omp parallel for schedule(dynamic) num_threads(num_threads)
    for (size_t i = 0; i < occurrences.size(); ++i) {
      accepted[i] = scorer->Score(phrase_pairs[occurrences[i]], &scores[i]);
    }

    int num_accepted = 0;
    cout << setprecision(12);
    for (size_t i = 0; i < occurrences.size(); ++i) {
      if (!accepted[i]) {
        continue;
      }
      ++num_accepted;
      cout << phrase_pairs[occurrences[i]] << " |||";
      for (double score: scores[i]) {
        cout << " " << score;
      }
      cout << '\n';
    }
    cout.flush();
    cerr << "Scoring kept " << num_accepted << " of " << occurrences.size()
         << " phrase pairs and took " << timer.GetElapsedSeconds()
         << " seconds" << endl;

    if (vm.count("check")) {
      cerr << "Checking against " << vm["check"].as<string>() << "..."
           << endl;
      PhraseTableChecker checker(scorer, phrase_pair_builder, phrase_index,
                                 config);
      CheckSummary summary;
      if (checker.CheckFile(vm["check"].as<string>(), &summary)) {
        cerr << summary << endl;
      }
    }
  } catch (const exception& e) {
    cerr << e.what() << endl;
    return 1;
  }

  return 0;
}
