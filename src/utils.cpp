
#include <sstream>
#include <vector>
#include "utils.h"

namespace semchart {
namespace utils {

namespace {

char ClosingOf(char c) {
    switch (c) {
        case '(': return ')';
        case '[': return ']';
        case '{': return '}';
        case '<': return '>';
        default: return 0;
    }
}

bool IsClosing(char c) {
    return c == ')' || c == ']' || c == '}' || c == '>';
}

// `<` and `>` double as angle brackets and as parts of `->` and `<->`
bool IsArrowPart(const std::string& in, unsigned i) {
    if (in[i] == '>')
        return i > 0 && in[i - 1] == '-';
    if (in[i] == '<')
        return in.compare(i, 3, "<->") == 0;
    return false;
}

} // namespace

int FindClosingBracket(const std::string& in, int start) {
    std::vector<char> expected;
    char quote = 0;
    for (unsigned i = start; i < in.size(); i++) {
        char c = in[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (IsArrowPart(in, i))
            continue;
        if (ClosingOf(c)) {
            expected.push_back(ClosingOf(c));
        } else if (IsClosing(c)) {
            if (expected.empty() || expected.back() != c)
                return -1;
            expected.pop_back();
            if (expected.empty())
                return i;
        }
    }
    return -1;
}

int FindNonNested(const std::string& haystack, const std::string& needle, int start) {
    int depth = 0;
    char quote = 0;
    for (unsigned i = start; i < haystack.size(); i++) {
        char c = haystack[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (depth == 0 && haystack.compare(i, needle.size(), needle) == 0)
            return i;
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (IsArrowPart(haystack, i))
            continue;
        if (ClosingOf(c))
            depth++;
        else if (IsClosing(c) && depth > 0)
            depth--;
    }
    return -1;
}

std::vector<std::string> SplitNonNested(const std::string& line, const std::string& delim) {
    std::vector<std::string> res;
    int from = 0, pos;
    while ((pos = FindNonNested(line, delim, from)) != -1) {
        res.push_back(line.substr(from, pos - from));
        from = pos + delim.size();
    }
    res.push_back(line.substr(from));
    return res;
}

std::vector<std::string> Split(const std::string& line, char delim) {
    std::istringstream iss(line);
    std::string tmp;
    std::vector<std::string> res;
    while (getline(iss, tmp, delim)) res.push_back(tmp);
    return res;
}

std::vector<std::string> Tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::string tmp;
    std::vector<std::string> res;
    while (iss >> tmp) res.push_back(tmp);
    return res;
}

std::string
trim(const std::string& string, const char* trimCharacterList) {
    std::string::size_type left = string.find_first_not_of(trimCharacterList);
    if (left != std::string::npos) {
        std::string::size_type right = string.find_last_not_of(trimCharacterList);
        return string.substr(left, right - left + 1);
    }
    return "";
}

std::string StripComment(const std::string& line) {
    int comment = FindNonNested(line, "#");
    if (comment > -1)
        return line.substr(0, comment);
    return line;
}

unsigned int utf8_strlen(std::string str) {

    unsigned int len = 0;
    unsigned char lead;
    unsigned char_size = 0;

    for (unsigned pos = 0; pos < str.size(); pos += char_size) {

        lead = str[pos];

        if (lead < 0x80) {
            char_size = 1;
        } else if (lead < 0xE0) {
            char_size = 2;
        } else if (lead < 0xF0) {
            char_size = 3;
        } else {
            char_size = 4;
        }

        len += 1;
    }

    return len;
}

} // namespace utils
} // namespace semchart
