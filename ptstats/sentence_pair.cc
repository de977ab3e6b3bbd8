#include "sentence_pair.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace ptstats {

SentencePair::SentencePair() {}

SentencePair::SentencePair(const vector<int>& source,
                           const vector<int>& target,
                           const vector<pair<int, int>>& links) :
    source(source), target(target), f2e(source.size()), e2f(target.size()) {
  for (pair<int, int> link: links) {
    if (link.first < 0 || link.first >= static_cast<int>(source.size()) ||
        link.second < 0 || link.second >= static_cast<int>(target.size())) {
      throw invalid_argument("Alignment link " + to_string(link.first) + "-" +
          to_string(link.second) + " is outside of a sentence pair of size " +
          to_string(source.size()) + "x" + to_string(target.size()));
    }
    vector<int>& targets = f2e[link.first];
    if (find(targets.begin(), targets.end(), link.second) != targets.end()) {
      continue;
    }
    targets.push_back(link.second);
    e2f[link.second].push_back(link.first);
  }
}

bool SentencePair::operator==(const SentencePair& other) const {
  return source == other.source && target == other.target &&
         f2e == other.f2e && e2f == other.e2f;
}

} // namespace ptstats
