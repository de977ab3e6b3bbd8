#include "phrase_index.h"

#include "phrase_pair.h"

namespace ptstats {

namespace {

// Separates the source and target symbols in a pair key. Nonterminals are
// negative, but never this small.
const int PAIR_SEPARATOR = -1000000;

} // namespace

PhraseIndex::PhraseIndex() {}

PhraseIndex::~PhraseIndex() {}

void PhraseIndex::AddToIndex(PhrasePair* phrase_pair) {
  vector<int> pair_key = GetPairKey(*phrase_pair);
  #pragma omp critical (phrase_index)
  {
    phrase_pair->pair_id = AddPhrase(pair_ids, pair_key);
    phrase_pair->source_id =
        AddPhrase(source_ids, phrase_pair->source_symbols);
    phrase_pair->target_id =
        AddPhrase(target_ids, phrase_pair->target_symbols);
  }
}

bool PhraseIndex::Lookup(PhrasePair* phrase_pair) const {
  phrase_pair->pair_id = FindPhrase(pair_ids, GetPairKey(*phrase_pair));
  phrase_pair->source_id =
      FindPhrase(source_ids, phrase_pair->source_symbols);
  phrase_pair->target_id =
      FindPhrase(target_ids, phrase_pair->target_symbols);
  return phrase_pair->pair_id >= 0 && phrase_pair->source_id >= 0 &&
         phrase_pair->target_id >= 0;
}

int PhraseIndex::GetNumPairs() const {
  return pair_ids.size();
}

int PhraseIndex::GetNumSourcePhrases() const {
  return source_ids.size();
}

int PhraseIndex::GetNumTargetPhrases() const {
  return target_ids.size();
}

int PhraseIndex::AddPhrase(PhraseIds& ids, const vector<int>& key) {
  auto it = ids.find(key);
  if (it != ids.end()) {
    return it->second;
  }
  int id = ids.size();
  ids[key] = id;
  return id;
}

int PhraseIndex::FindPhrase(const PhraseIds& ids, const vector<int>& key) {
  auto it = ids.find(key);
  return it == ids.end() ? -1 : it->second;
}

vector<int> PhraseIndex::GetPairKey(const PhrasePair& phrase_pair) {
  vector<int> key = phrase_pair.source_symbols;
  key.push_back(PAIR_SEPARATOR);
  key.insert(key.end(), phrase_pair.target_symbols.begin(),
             phrase_pair.target_symbols.end());
  return key;
}

} // namespace ptstats
