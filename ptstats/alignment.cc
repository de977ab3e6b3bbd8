#include "alignment.h"

#include <stdexcept>

#include <boost/algorithm/string.hpp>

namespace ptstats {

Alignment::Alignment(istream& input) {
  string line;
  int line_number = 0;
  while (getline(input, line)) {
    ++line_number;
    vector<pair<int, int>> alignment;
    boost::trim(line);
    if (!line.empty()) {
      vector<string> items;
      boost::split(items, line, boost::is_any_of(" \t-"),
                   boost::token_compress_on);
      if (items.size() % 2 != 0) {
        throw runtime_error("Odd number of alignment positions at line " +
                            to_string(line_number) + ": " + line);
      }
      alignment.reserve(items.size() / 2);
      try {
        for (size_t i = 1; i < items.size(); i += 2) {
          alignment.push_back(make_pair(stoi(items[i - 1]), stoi(items[i])));
        }
      } catch (const logic_error&) {
        throw runtime_error("Bad alignment link at line " +
                            to_string(line_number) + ": " + line);
      }
    }
    alignments.push_back(alignment);
  }
  alignments.shrink_to_fit();
}

Alignment::Alignment() {}

Alignment::~Alignment() {}

vector<pair<int, int>> Alignment::GetLinks(int sentence_index) const {
  return alignments[sentence_index];
}

int Alignment::GetNumSentences() const {
  return alignments.size();
}

bool Alignment::operator==(const Alignment& other) const {
  return alignments == other.alignments;
}

} // namespace ptstats
