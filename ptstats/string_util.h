#ifndef _STRING_UTIL_H_
#define _STRING_UTIL_H_

#include <string>
#include <vector>

using namespace std;

namespace ptstats {

// Splits a line on the ||| field separator and strips the whitespace around
// every field. Empty fields are kept.
vector<string> SplitFields(const string& line);

// Splits a string into whitespace separated tokens.
vector<string> Tokenize(const string& text);

} // namespace ptstats

#endif
