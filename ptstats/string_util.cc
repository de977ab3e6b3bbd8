#include "string_util.h"

#include <boost/algorithm/string.hpp>

namespace ptstats {

vector<string> SplitFields(const string& line) {
  vector<string> fields;
  boost::iter_split(fields, line, boost::first_finder("|||"));
  for (string& field: fields) {
    boost::trim(field);
  }
  return fields;
}

vector<string> Tokenize(const string& text) {
  vector<string> tokens;
  string trimmed = boost::trim_copy(text);
  if (trimmed.empty()) {
    return tokens;
  }
  boost::split(tokens, trimmed, boost::is_any_of(" \t"),
               boost::token_compress_on);
  return tokens;
}

} // namespace ptstats
