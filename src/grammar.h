
#ifndef INCLUDE_SEMCHART_GRAMMAR_H_
#define INCLUDE_SEMCHART_GRAMMAR_H_

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "cat.h"
#include "feat.h"

namespace semchart {

class Rule;
typedef std::shared_ptr<const Rule> RuleType;

// LHS[features] -> RHS1[features] ... RHSn[features], or LHS[features] -> 'token'
class Rule
{
public:
    Rule(Cat lhs, FeatType lhs_features,
         const std::vector<Cat>& rhs, const std::vector<FeatType>& rhs_features);
    Rule(Cat lhs, FeatType lhs_features, const std::string& token);

    Cat GetLhs() const { return lhs_; }
    FeatType GetLhsFeatures() const { return lhs_features_; }
    const std::vector<Cat>& GetRhs() const { return rhs_; }
    const std::vector<FeatType>& GetRhsFeatures() const { return rhs_features_; }
    const std::string& GetToken() const { return token_; }

    bool IsLexical() const { return rhs_.empty(); }
    bool IsUnary() const { return rhs_.size() == 1; }
    unsigned Arity() const { return rhs_.size(); }

    std::string ToStr() const;

    friend std::ostream& operator<<(std::ostream& ost, const RuleType& rule) {
        ost << rule->ToStr();
        return ost;
    }

private:
    Cat lhs_;
    FeatType lhs_features_;
    std::vector<Cat> rhs_;
    std::vector<FeatType> rhs_features_;
    std::string token_;
};

// a feature grammar, read-only once loaded
class Grammar
{
public:
    // validates the rules and builds the lookup indexes.
    // throws MalformedGrammar. `start` defaults to the first rule's LHS.
    static Grammar Load(const std::vector<RuleType>& rules, Cat start = nullptr);

    Cat Start() const { return start_; }
    const std::vector<RuleType>& GetRules() const { return rules_; }
    unsigned Size() const { return rules_.size(); }

    // rules whose left hand side is `cat`
    const std::vector<RuleType>& RulesFor(Cat cat) const;

    // terminal rules rewriting to `token`
    const std::vector<RuleType>& LexicalRules(const std::string& token) const;

    // rules with the single right hand symbol `cat`
    const std::vector<RuleType>& UnaryRules(Cat cat) const;

    // rules with two or more right hand symbols, the first being `cat`
    const std::vector<RuleType>& NaryRules(Cat cat) const;

    // names of the top level features used with `cat` anywhere in the grammar
    const std::set<std::string>& FeaturesOf(Cat cat) const;

    bool HasCategory(Cat cat) const { return by_lhs_.count(cat) > 0; }

private:
    Grammar() {}

    std::vector<RuleType> rules_;
    Cat start_;
    std::unordered_map<Cat, std::vector<RuleType>> by_lhs_;
    std::unordered_map<std::string, std::vector<RuleType>> lexical_;
    std::unordered_map<Cat, std::vector<RuleType>> unary_;
    std::unordered_map<Cat, std::vector<RuleType>> nary_;
    std::unordered_map<Cat, std::set<std::string>> features_;
};

} // namespace semchart

#endif
