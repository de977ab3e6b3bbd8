#ifndef _VOCABULARY_H_
#define _VOCABULARY_H_

#include <string>
#include <unordered_map>
#include <vector>

using namespace std;

namespace ptstats {

/**
 * Data structure for mapping words to word ids.
 *
 * Source and target words share a single vocabulary, so the NULL word (the
 * counterpart of every unaligned token) has the same id on both sides. Gap
 * markers of discontinuous phrases are not words: they are represented as
 * negative nonterminal ids and are never stored here.
 *
 * Note: The vocabulary is shared by all the threads reading the corpus, so the
 * read/write operations run in a critical region.
 */
class Vocabulary {
 public:
  static const int NULL_WORD;
  static const string NULL_WORD_STR;

  Vocabulary();

  virtual ~Vocabulary();

  // Returns the word id for the given word. New words get the next free id.
  virtual int GetTerminalIndex(const string& word);

  // Returns the word id for the given word or -1 if the word has never been
  // observed.
  virtual int GetWordId(const string& word) const;

  // Returns the id for a nonterminal located at the given position in a phrase.
  int GetNonterminalIndex(int position) const;

  // Checks if a token marks a gap ([X] or [X,1]) rather than a word.
  static bool IsNonterminalToken(const string& token);

  // Returns the word corresponding to the given word id.
  virtual string GetTerminalValue(int symbol) const;

  // Returns the number of words, including the NULL word.
  int Size() const;

  bool operator==(const Vocabulary& vocabulary) const;

 private:
  unordered_map<string, int> dictionary;
  vector<string> words;
};

} // namespace ptstats

#endif
