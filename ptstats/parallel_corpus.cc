#include "parallel_corpus.h"

#include <stdexcept>

#include "alignment.h"
#include "string_util.h"
#include "vocabulary.h"

namespace ptstats {

ParallelCorpus::ParallelCorpus(shared_ptr<Vocabulary> vocabulary) :
    vocabulary(vocabulary) {}

ParallelCorpus::~ParallelCorpus() {}

void ParallelCorpus::Read(istream& source, istream& target,
                          const Alignment& alignment) {
  vector<string> source_lines = ReadLines(source);
  vector<string> target_lines = ReadLines(target);
  CreateSentences(source_lines, target_lines, alignment);
}

void ParallelCorpus::ReadBitext(istream& bitext, const Alignment& alignment) {
  vector<string> lines = ReadLines(bitext);
  vector<string> source_lines, target_lines;
  for (const string& line: lines) {
    source_lines.push_back(GetSide(line, SOURCE));
    target_lines.push_back(GetSide(line, TARGET));
  }
  CreateSentences(source_lines, target_lines, alignment);
}

const vector<SentencePair>& ParallelCorpus::GetSentences() const {
  return sentences;
}

int ParallelCorpus::GetNumSentences() const {
  return sentences.size();
}

vector<string> ParallelCorpus::ReadLines(istream& input) {
  vector<string> lines;
  string line;
  while (getline(input, line)) {
    lines.push_back(line);
  }
  return lines;
}

string ParallelCorpus::GetSide(const string& line, const Side& side) {
  string delimiter = "|||";
  size_t position = line.find(delimiter);
  if (position == string::npos) {
    throw runtime_error("Missing ||| separator in bitext line: " + line);
  }
  if (side == SOURCE) {
    return line.substr(0, position);
  }
  return line.substr(position + delimiter.size());
}

void ParallelCorpus::CreateSentences(const vector<string>& source_lines,
                                     const vector<string>& target_lines,
                                     const Alignment& alignment) {
  if (source_lines.size() != target_lines.size() ||
      source_lines.size() != static_cast<size_t>(alignment.GetNumSentences())) {
    throw runtime_error("Corpus size mismatch: " +
        to_string(source_lines.size()) + " source sentences, " +
        to_string(target_lines.size()) + " target sentences, " +
        to_string(alignment.GetNumSentences()) + " alignments");
  }

  sentences.reserve(sentences.size() + source_lines.size());
  for (size_t i = 0; i < source_lines.size(); ++i) {
    try {
      sentences.push_back(SentencePair(ConvertWords(source_lines[i]),
                                       ConvertWords(target_lines[i]),
                                       alignment.GetLinks(i)));
    } catch (const invalid_argument& e) {
      throw runtime_error(string(e.what()) + " at line " + to_string(i + 1));
    }
  }
}

vector<int> ParallelCorpus::ConvertWords(const string& line) {
  vector<int> word_ids;
  for (const string& word: Tokenize(line)) {
    word_ids.push_back(vocabulary->GetTerminalIndex(word));
  }
  return word_ids;
}

} // namespace ptstats
