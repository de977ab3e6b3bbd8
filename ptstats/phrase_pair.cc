#include "phrase_pair.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace ptstats {

namespace {

string GetPhraseString(const vector<int>& symbols,
                       const vector<string>& words) {
  ostringstream os;
  size_t current_word = 0;
  for (size_t i = 0; i < symbols.size(); ++i) {
    if (i > 0) {
      os << " ";
    }
    if (symbols[i] < 0) {
      os << "[X," << -symbols[i] << "]";
    } else if (current_word < words.size()) {
      os << words[current_word++];
    } else {
      os << symbols[i];
    }
  }
  return os.str();
}

string GetWordAt(const vector<int>& symbols, const vector<string>& words,
                 int position) {
  if (symbols[position] < 0) {
    return "[X," + to_string(-symbols[position]) + "]";
  }
  size_t word_index = 0;
  for (int i = 0; i < position; ++i) {
    if (symbols[i] >= 0) {
      ++word_index;
    }
  }
  if (word_index < words.size()) {
    return words[word_index];
  }
  return to_string(symbols[position]);
}

} // namespace

PhrasePair::PhrasePair() : pair_id(-1), source_id(-1), target_id(-1) {}

PhrasePair::PhrasePair(const vector<int>& source_symbols,
                       const vector<int>& target_symbols,
                       const vector<string>& source_words,
                       const vector<string>& target_words,
                       const vector<pair<int, int>>& links) :
    pair_id(-1), source_id(-1), target_id(-1),
    source_symbols(source_symbols), target_symbols(target_symbols),
    source_words(source_words), target_words(target_words),
    f2e(source_symbols.size()), e2f(target_symbols.size()) {
  for (pair<int, int> link: links) {
    if (link.first < 0 ||
        link.first >= static_cast<int>(source_symbols.size()) ||
        link.second < 0 ||
        link.second >= static_cast<int>(target_symbols.size())) {
      throw invalid_argument("Alignment link " + to_string(link.first) + "-" +
          to_string(link.second) + " is outside of the phrase pair");
    }
    vector<int>& targets = f2e[link.first];
    if (find(targets.begin(), targets.end(), link.second) != targets.end()) {
      continue;
    }
    this->links.push_back(link);
    targets.push_back(link.second);
    e2f[link.second].push_back(link.first);
  }
}

string PhrasePair::GetSourceString() const {
  return GetPhraseString(source_symbols, source_words);
}

string PhrasePair::GetTargetString() const {
  return GetPhraseString(target_symbols, target_words);
}

string PhrasePair::GetSourceWord(int position) const {
  return GetWordAt(source_symbols, source_words, position);
}

string PhrasePair::GetTargetWord(int position) const {
  return GetWordAt(target_symbols, target_words, position);
}

string PhrasePair::GetAlignmentString() const {
  ostringstream os;
  for (size_t i = 0; i < links.size(); ++i) {
    if (i > 0) {
      os << " ";
    }
    os << links[i].first << "-" << links[i].second;
  }
  return os.str();
}

ostream& operator<<(ostream& os, const PhrasePair& phrase_pair) {
  return os << phrase_pair.GetSourceString() << " ||| "
            << phrase_pair.GetTargetString() << " ||| "
            << phrase_pair.GetAlignmentString();
}

} // namespace ptstats
