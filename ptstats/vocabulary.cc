#include "vocabulary.h"

namespace ptstats {

const int Vocabulary::NULL_WORD = 0;
const string Vocabulary::NULL_WORD_STR = "NULL";

Vocabulary::Vocabulary() {
  dictionary[NULL_WORD_STR] = NULL_WORD;
  words.push_back(NULL_WORD_STR);
}

Vocabulary::~Vocabulary() {}

int Vocabulary::GetTerminalIndex(const string& word) {
  int word_id = -1;
  #pragma omp critical (vocabulary)
  {
    auto it = dictionary.find(word);
    if (it != dictionary.end()) {
      word_id = it->second;
    } else {
      word_id = words.size();
      dictionary[word] = word_id;
      words.push_back(word);
    }
  }
  return word_id;
}

int Vocabulary::GetWordId(const string& word) const {
  int word_id = -1;
  #pragma omp critical (vocabulary)
  {
    auto it = dictionary.find(word);
    if (it != dictionary.end()) {
      word_id = it->second;
    }
  }
  return word_id;
}

int Vocabulary::GetNonterminalIndex(int position) const {
  return -position;
}

bool Vocabulary::IsNonterminalToken(const string& token) {
  return token.size() > 2 && token[0] == '[' && token[token.size() - 1] == ']';
}

string Vocabulary::GetTerminalValue(int symbol) const {
  string word;
  #pragma omp critical (vocabulary)
  word = words[symbol];
  return word;
}

int Vocabulary::Size() const {
  int size;
  #pragma omp critical (vocabulary)
  size = words.size();
  return size;
}

bool Vocabulary::operator==(const Vocabulary& other) const {
  return words == other.words && dictionary == other.dictionary;
}

} // namespace ptstats
