
#include <cctype>
#include <fstream>
#include <sstream>
#include "grammar_loader.h"
#include "errors.h"
#include "utils.h"

namespace semchart {

namespace {

// Cat or Cat[features] starting at `*pos`; advances past it
std::pair<Cat, FeatType> ReadSymbol(const std::string& line, unsigned* pos) {
    unsigned i = *pos;
    while (i < line.size() && IsCategoryName(std::string(1, line[i])))
        i++;
    if (i == *pos)
        throw std::runtime_error("category expected at: " + line.substr(*pos));
    Cat cat = Category::Parse(line.substr(*pos, i - *pos));
    FeatType features;
    if (i < line.size() && line[i] == '[') {
        int close = utils::FindClosingBracket(line, i);
        if (close < 0)
            throw std::runtime_error("unbalanced brackets in: " + line.substr(i));
        features = FeatStruct::Parse(line.substr(i, close - i + 1));
        i = close + 1;
    } else {
        features = std::make_shared<const FeatStruct>();
    }
    *pos = i;
    return std::make_pair(cat, features);
}

void SkipSpaces(const std::string& line, unsigned* pos) {
    while (*pos < line.size() && std::isspace(static_cast<unsigned char>(line[*pos])))
        (*pos)++;
}

RuleType ReadAlternative(Cat lhs, FeatType lhs_features, const std::string& alternative) {
    std::string rhs = utils::trim(alternative);
    if (rhs.empty())
        throw MalformedGrammar("empty right hand side for " + lhs->ToStr());
    if (rhs[0] == '\'' || rhs[0] == '"') {
        std::string::size_type close = rhs.find(rhs[0], 1);
        if (close == std::string::npos)
            throw std::runtime_error("unterminated terminal: " + rhs);
        if (! utils::trim(rhs.substr(close + 1)).empty())
            throw std::runtime_error("a terminal must stand alone: " + rhs);
        return std::make_shared<const Rule>(lhs, lhs_features, rhs.substr(1, close - 1));
    }
    std::vector<Cat> cats;
    std::vector<FeatType> features;
    unsigned pos = 0;
    while (pos < rhs.size()) {
        auto symbol = ReadSymbol(rhs, &pos);
        cats.push_back(symbol.first);
        features.push_back(symbol.second);
        SkipSpaces(rhs, &pos);
    }
    return std::make_shared<const Rule>(lhs, lhs_features, cats, features);
}

void ReadRules(const std::string& line, std::vector<RuleType>* rules) {
    int arrow = utils::FindNonNested(line, "->");
    if (arrow < 0)
        throw std::runtime_error("'->' expected");
    std::string lhs_str = utils::trim(line.substr(0, arrow));
    unsigned pos = 0;
    auto lhs = ReadSymbol(lhs_str, &pos);
    if (pos != lhs_str.size())
        throw std::runtime_error("a single category expected on the left hand side: " + lhs_str);
    for (auto&& alternative: utils::SplitNonNested(line.substr(arrow + 2), "|"))
        rules->push_back(ReadAlternative(lhs.first, lhs.second, alternative));
}

} // namespace

Grammar ParseGrammar(std::istream& in) {
    std::vector<RuleType> rules;
    Cat start = nullptr;
    std::string line;
    unsigned lineno = 0;
    while (getline(in, line)) {
        lineno++;
        try {
            line = utils::trim(utils::StripComment(line));
            if (line.empty()) continue;
            if (line[0] == '%') {
                std::vector<std::string> items = utils::Tokenize(line.substr(1));
                if (items.size() != 2 || items[0] != "start")
                    throw std::runtime_error("unknown directive: " + line);
                start = Category::Parse(items[1]);
                continue;
            }
            ReadRules(line, &rules);
        } catch (const MalformedGrammar& e) {
            throw MalformedGrammar(e.Detail(), lineno);
        } catch (const std::runtime_error& e) {
            throw MalformedGrammar(e.what(), lineno);
        }
    }
    return Grammar::Load(rules, start);
}

Grammar ParseGrammarString(const std::string& text) {
    std::istringstream in(text);
    return ParseGrammar(in);
}

Grammar LoadGrammar(const std::string& filename) {
    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("failed to open: " + filename);
    return ParseGrammar(in);
}

} // namespace semchart
