
#ifndef INCLUDE_SEMCHART_UTILS_H_
#define INCLUDE_SEMCHART_UTILS_H_

#include <string>
#include <vector>

namespace semchart {
namespace utils {

// index of the bracket closing the one opened at `start`, honouring
// (), [], {} and <> nesting as well as quoted strings. -1 if unbalanced.
int FindClosingBracket(const std::string& in, int start);

// first occurrence of `needle` at nesting depth zero, searching from `start`
int FindNonNested(const std::string& haystack, const std::string& needle, int start = 0);

// split at every top-level occurrence of `delim`
std::vector<std::string> SplitNonNested(const std::string& line, const std::string& delim);

std::vector<std::string> Split(const std::string& line, char delim);

// whitespace tokenization; runs of blanks never produce empty tokens
std::vector<std::string> Tokenize(const std::string& line);

std::string
trim(const std::string& string, const char* trimCharacterList=" \t\v\r\n");

// drop a `#` comment that is outside quotes and brackets
std::string StripComment(const std::string& line);

unsigned int utf8_strlen(std::string str);

} // namespace utils
} // namespace semchart

#endif
