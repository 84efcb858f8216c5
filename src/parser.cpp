
#include <exception>
#include <memory>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "parser.h"
#include "errors.h"
#include "instantiate.h"
#include "unify.h"
#include "utils.h"

namespace semchart {

bool ChartParser::keep_going = true;

FeatType ChartParser::Combine(RuleType rule, const std::vector<EdgeType>& children) const {
    std::unordered_map<std::string, std::string> renaming;
    Bindings bindings;
    for (unsigned i = 0; i < children.size(); i++) {
        Value pattern = RenameApart(rule->GetRhsFeatures()[i], &renaming);
        if (! Unify(pattern, children[i]->GetFeatures(), &bindings))
            return nullptr;
    }
    Value res = Substitute(RenameApart(rule->GetLhsFeatures(), &renaming), bindings);
    if (! res)
        return nullptr;
    return std::static_pointer_cast<const FeatStruct>(res);
}

bool ChartParser::AddEdge(Chart& chart, ChartCell* cell, EdgeType edge, const std::string& key) {
    if (! chart.Insert(cell, edge, key))
        return false;
    logger_.RecordEdge("ADDED", edge.get());
    if (max_edges_ > 0 && chart.NumEdges() > max_edges_)
        throw ChartOverflow(max_edges_);
    return true;
}

void ChartParser::AddLeaf(Chart& chart, RuleType rule, const std::string& word, int position) {
    std::unordered_map<std::string, std::string> renaming;
    FeatType features = std::static_pointer_cast<const FeatStruct>(
            RenameApart(rule->GetLhsFeatures(), &renaming));
    ChartCell* cell = chart(position, 0);
    std::string key = EdgeKey(rule->GetLhs(), features);
    if (cell->Contains(key))
        return;
    EdgeType leaf = std::make_shared<const Leaf>(word, rule->GetLhs(),
            InstantiatePlaceholders(features), rule, position);
    AddEdge(chart, cell, leaf, key);
}

void ChartParser::AddTree(Chart& chart, ChartCell* cell, RuleType rule,
                          const std::vector<EdgeType>& children) {
    FeatType features = Combine(rule, children);
    if (! features)
        return;
    std::string key = EdgeKey(rule->GetLhs(), features);
    if (cell->Contains(key))
        return;
    EdgeType tree = std::make_shared<const Tree>(rule->GetLhs(),
            InstantiatePlaceholders(features), rule, children);
    AddEdge(chart, cell, tree, key);
}

void ChartParser::Extend(Chart& chart, ChartCell* cell, RuleType rule,
                         std::vector<EdgeType>& children, int pos, int end) {
    unsigned k = children.size();
    if (k == rule->Arity()) {
        if (pos == end)
            AddTree(chart, cell, rule, children);
        return;
    }
    Cat cat = rule->GetRhs()[k];
    int remaining = rule->Arity() - k - 1;
    for (int length = 1; pos + length + remaining <= end; length++) {
        const ChartCell* other = chart.Get(pos, length - 1);
        if (! other)
            continue;
        auto range = other->EdgesOf(cat);
        for (auto it = range.first; it != range.second; ++it) {
            children.push_back(it->second);
            Extend(chart, cell, rule, children, pos + length, end);
            children.pop_back();
        }
    }
}

void ChartParser::CloseUnary(Chart& chart, ChartCell* cell) {
    for (unsigned i = 0; i < cell->ordered.size(); i++) {
        EdgeType edge = cell->ordered[i];
        for (auto&& rule: grammar_.UnaryRules(edge->GetCategory()))
            AddTree(chart, cell, rule, std::vector<EdgeType>({edge}));
    }
}

ParseResult ChartParser::Parse(int id, const std::vector<std::string>& tokens) {
    int sent_size = (int)tokens.size();
    if (sent_size == 0)
        return ParseResult(id, tokens, std::vector<EdgeType>(), 0);
    Chart chart(sent_size);

    for (int i = 0; i < sent_size; i++) {
        for (auto&& rule: grammar_.LexicalRules(tokens[i]))
            AddLeaf(chart, rule, tokens[i], i);
        CloseUnary(chart, chart(i, 0));
    }

    for (int span_length = 2; span_length <= sent_size && keep_going; span_length++) {
        for (int start = 0; start + span_length <= sent_size; start++) {
            ChartCell* cell = chart(start, span_length - 1);
            int end = start + span_length;
            for (int first = 1; first < span_length; first++) {
                const ChartCell* left = chart.Get(start, first - 1);
                if (! left)
                    continue;
                for (unsigned i = 0; i < left->ordered.size(); i++) {
                    EdgeType edge = left->ordered[i];
                    for (auto&& rule: grammar_.NaryRules(edge->GetCategory())) {
                        std::vector<EdgeType> children({edge});
                        Extend(chart, cell, rule, children, start + first, end);
                    }
                }
            }
            CloseUnary(chart, cell);
        }
    }

    return ParseResult(id, tokens, chart.Spanning(grammar_.Start()), chart.NumEdges());
}

ParseResult ChartParser::Parse(int id, const std::string& sent) {
    return Parse(id, utils::Tokenize(sent));
}

std::vector<ParseResult> ChartParser::ParseSentences(const std::vector<std::string>& doc) {
    logger_(Info) << "parsing " + std::to_string(doc.size()) + " sentences";
    std::vector<ParseResult> res(doc.size());
    std::vector<std::exception_ptr> errors(doc.size());
    #pragma omp parallel for schedule(dynamic, 1)
    for (unsigned i = 0; i < doc.size(); i++) {
        if (! keep_going)
            continue;
        try {
            res[i] = Parse(i, doc[i]);
        } catch (...) {
            errors[i] = std::current_exception();
        }
        logger_.CompleteOne();
    }
    for (auto&& error: errors) {
        if (error)
            std::rethrow_exception(error);
    }
    for (auto&& result: res) {
        if (result.NoParse() && result.GetId() >= 0)
            logger_(Info) << "failed to parse sentence " + std::to_string(result.GetId());
    }
    return res;
}

} // namespace semchart
