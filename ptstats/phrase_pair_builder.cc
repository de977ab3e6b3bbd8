#include "phrase_pair_builder.h"

#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "phrase_pair.h"
#include "string_util.h"
#include "vocabulary.h"

namespace ptstats {

namespace {

int ParsePosition(const string& token, const string& alignment) {
  size_t end = 0;
  int position = -1;
  try {
    position = stoi(token, &end);
  } catch (const logic_error&) {
    end = 0;
  }
  if (end == 0 || end != token.size() || position < 0) {
    throw invalid_argument("Bad alignment position '" + token + "' in: " +
                           alignment);
  }
  return position;
}

} // namespace

PhrasePairBuilder::PhrasePairBuilder(shared_ptr<Vocabulary> vocabulary) :
    vocabulary(vocabulary) {}

PhrasePairBuilder::~PhrasePairBuilder() {}

PhrasePair PhrasePairBuilder::Build(const string& source,
                                    const string& target,
                                    const string& alignment) {
  vector<int> source_symbols, target_symbols;
  vector<string> source_words, target_words;
  vector<string> source_tokens = Tokenize(source);
  ConvertTokens(source_tokens, &source_symbols, &source_words);
  ConvertTokens(Tokenize(target), &target_symbols, &target_words);
  return PhrasePair(source_symbols, target_symbols, source_words,
                    target_words,
                    ParseAlignment(alignment, source_tokens.size()));
}

PhrasePair PhrasePairBuilder::Parse(const string& line) {
  vector<string> fields = SplitFields(line);
  if (fields.size() != 3) {
    throw invalid_argument("Expecting three fields in phrase pair, found " +
                           to_string(fields.size()) + ": " + line);
  }
  return Build(fields[0], fields[1], fields[2]);
}

vector<pair<int, int>> PhrasePairBuilder::ParseAlignment(
    const string& alignment, int source_size) {
  vector<pair<int, int>> links;
  vector<string> items = Tokenize(alignment);

  if (alignment.find('(') == string::npos) {
    for (const string& item: items) {
      size_t dash = item.find('-');
      if (dash == string::npos) {
        throw invalid_argument("Bad alignment link '" + item + "' in: " +
                               alignment);
      }
      links.push_back(make_pair(ParsePosition(item.substr(0, dash), alignment),
                                ParsePosition(item.substr(dash + 1),
                                              alignment)));
    }
    return links;
  }

  // Moses format: one parenthesized list of target positions per source word.
  if (items.size() != static_cast<size_t>(source_size)) {
    throw invalid_argument("Expected " + to_string(source_size) +
        " alignment lists, found " + to_string(items.size()) + " in: " +
        alignment);
  }
  for (size_t i = 0; i < items.size(); ++i) {
    const string& item = items[i];
    if (item.size() < 2 || item[0] != '(' || item[item.size() - 1] != ')') {
      throw invalid_argument("Bad alignment list '" + item + "' in: " +
                             alignment);
    }
    string positions = item.substr(1, item.size() - 2);
    if (positions.empty()) {
      continue;
    }
    vector<string> targets;
    boost::split(targets, positions, boost::is_any_of(","));
    for (const string& target: targets) {
      links.push_back(make_pair(i, ParsePosition(target, alignment)));
    }
  }
  return links;
}

void PhrasePairBuilder::ConvertTokens(const vector<string>& tokens,
                                      vector<int>* symbols,
                                      vector<string>* words) {
  int num_nonterminals = 0;
  for (const string& token: tokens) {
    if (Vocabulary::IsNonterminalToken(token)) {
      ++num_nonterminals;
      symbols->push_back(vocabulary->GetNonterminalIndex(num_nonterminals));
    } else {
      symbols->push_back(vocabulary->GetTerminalIndex(token));
      words->push_back(token);
    }
  }
}

} // namespace ptstats
