#ifndef _PARALLEL_CORPUS_H_
#define _PARALLEL_CORPUS_H_

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "sentence_pair.h"

using namespace std;

namespace ptstats {

class Alignment;
class Vocabulary;

enum Side {
  SOURCE,
  TARGET
};

/**
 * Word aligned parallel corpus in numberized format.
 *
 * Words from both sides are mapped to ids through the shared vocabulary. The
 * corpus is read either from two files with one sentence per line or from a
 * single bitext file where the source and target sentences are separated by
 * |||.
 */
class ParallelCorpus {
 public:
  ParallelCorpus(shared_ptr<Vocabulary> vocabulary);

  virtual ~ParallelCorpus();

  // Reads the corpus from separate source and target streams. Throws
  // runtime_error if the number of lines differ or if a link points outside
  // its sentence pair.
  void Read(istream& source, istream& target, const Alignment& alignment);

  // Reads the corpus from a bitext stream (source ||| target).
  void ReadBitext(istream& bitext, const Alignment& alignment);

  const vector<SentencePair>& GetSentences() const;

  int GetNumSentences() const;

 private:
  static vector<string> ReadLines(istream& input);

  static string GetSide(const string& line, const Side& side);

  void CreateSentences(const vector<string>& source_lines,
                       const vector<string>& target_lines,
                       const Alignment& alignment);

  vector<int> ConvertWords(const string& line);

  shared_ptr<Vocabulary> vocabulary;
  vector<SentencePair> sentences;
};

} // namespace ptstats

#endif
