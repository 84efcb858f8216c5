
#ifndef INCLUDE_SEMCHART_PARSER_H_
#define INCLUDE_SEMCHART_PARSER_H_

#include <string>
#include <vector>
#include "chart.h"
#include "grammar.h"
#include "logger.h"
#include "tree.h"

namespace semchart {

// the complete parses of one sentence. an empty result means the sentence
// is not in the language of the grammar, which is not an error.
class ParseResult
{
public:
    ParseResult(): id_(-1), num_edges_(0) {}
    ParseResult(int id, const std::vector<std::string>& tokens,
                const std::vector<EdgeType>& parses, unsigned num_edges)
        : id_(id), tokens_(tokens), parses_(parses), num_edges_(num_edges) {}

    bool NoParse() const { return parses_.empty(); }
    int GetId() const { return id_; }
    const std::vector<std::string>& GetTokens() const { return tokens_; }
    const std::vector<EdgeType>& GetParses() const { return parses_; }
    unsigned Size() const { return parses_.size(); }
    // edges built while parsing
    unsigned NumEdges() const { return num_edges_; }

private:
    int id_;
    std::vector<std::string> tokens_;
    std::vector<EdgeType> parses_;
    unsigned num_edges_;
};

// bottom-up chart parser for feature grammars. a parser may be shared by
// several threads; each sentence is parsed on one thread with its own chart.
class ChartParser
{
public:
    ChartParser(const Grammar& grammar, LogLevel loglevel, unsigned max_edges = 0)
     :grammar_(grammar),
      max_edges_(max_edges),
      logger_(loglevel) {}

    const Grammar& GetGrammar() const { return grammar_; }
    void SetMaxEdges(unsigned max_edges) { max_edges_ = max_edges; }

    // throws ChartOverflow when more than max_edges edges are built
    ParseResult Parse(int id, const std::vector<std::string>& tokens);
    ParseResult Parse(const std::vector<std::string>& tokens) { return Parse(0, tokens); }

    // one whitespace separated sentence
    ParseResult Parse(int id, const std::string& sent);

    // every sentence of `doc` in parallel
    std::vector<ParseResult> ParseSentences(const std::vector<std::string>& doc);

    // to capture SIGINT or SIGTERM
    static bool keep_going;

private:
    // unify the children with the rule's right hand side templates;
    // nullptr when they do not match
    FeatType Combine(RuleType rule, const std::vector<EdgeType>& children) const;

    void AddLeaf(Chart& chart, RuleType rule, const std::string& word, int position);
    void AddTree(Chart& chart, ChartCell* cell, RuleType rule,
                 const std::vector<EdgeType>& children);
    bool AddEdge(Chart& chart, ChartCell* cell, EdgeType edge, const std::string& key);

    // try every way of covering [pos, end) with the remaining right hand symbols
    void Extend(Chart& chart, ChartCell* cell, RuleType rule,
                std::vector<EdgeType>& children, int pos, int end);

    // unary rules over a cell until nothing new is added
    void CloseUnary(Chart& chart, ChartCell* cell);

    Grammar grammar_;
    unsigned max_edges_;
    ParserLogger logger_;
};

} // namespace semchart

#endif
