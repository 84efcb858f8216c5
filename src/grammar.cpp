
#include <sstream>
#include "grammar.h"
#include "errors.h"

namespace semchart {

namespace {

const std::vector<RuleType> kNoRules;
const std::set<std::string> kNoFeatures;

template<typename Key>
const std::vector<RuleType>& Find(
        const std::unordered_map<Key, std::vector<RuleType>>& index, const Key& key) {
    auto it = index.find(key);
    return it == index.end() ? kNoRules : it->second;
}

// bo(expr, @x) or bo(expr, ?v)
void CheckBindingOperator(const Rule& rule, TermType term) {
    if (term->IsApplication() &&
            term->GetFunction()->IsApplication() &&
            term->GetFunction()->GetFunction()->IsConstant() &&
            term->GetFunction()->GetFunction()->GetName() == kBindingOperator &&
            term->GetArgument()->IsMeta())
        return;
    throw MalformedGrammar(kSem + "." + kBo + " members must have the form "
            + kBindingOperator + "(expr, @x) or " + kBindingOperator
            + "(expr, ?v), not " + term->ToStr() + " in: " + rule.ToStr());
}

// SEM is a term, a variable, or [CORE=<term>|?v, BO={..}|?v]
void CheckSemantics(const Rule& rule, FeatType fs) {
    Value sem = fs->Get(kSem);
    if (! sem || sem->IsVariable() || sem->IsTerm())
        return;
    if (! sem->IsStruct())
        throw MalformedGrammar(kSem + " must be a term or a structure in: " + rule.ToStr());
    for (auto&& feature: sem->AsStruct().GetFeatures()) {
        const std::string& name = feature.first;
        const Value& value = feature.second;
        if (name == kCore) {
            if (! (value->IsTerm() || value->IsVariable()))
                throw MalformedGrammar(kSem + "." + kCore +
                        " must be a term or a variable in: " + rule.ToStr());
        } else if (name == kBo) {
            if (! (value->IsSet() || value->IsVariable()))
                throw MalformedGrammar(kSem + "." + kBo +
                        " must be a set or a variable in: " + rule.ToStr());
            if (value->IsSet()) {
                for (auto&& element: value->GetElements())
                    CheckBindingOperator(rule, element);
            }
        } else {
            throw MalformedGrammar("unknown feature " + kSem + "." + name +
                    " in: " + rule.ToStr());
        }
    }
}

} // namespace

Rule::Rule(Cat lhs, FeatType lhs_features,
           const std::vector<Cat>& rhs, const std::vector<FeatType>& rhs_features)
    : lhs_(lhs), lhs_features_(lhs_features), rhs_(rhs), rhs_features_(rhs_features) {
    if (rhs_.empty())
        throw MalformedGrammar("empty right hand side for " + lhs->ToStr());
    if (rhs_.size() != rhs_features_.size())
        throw MalformedGrammar("feature templates do not match the right hand side of "
                + lhs->ToStr());
}

Rule::Rule(Cat lhs, FeatType lhs_features, const std::string& token)
    : lhs_(lhs), lhs_features_(lhs_features), token_(token) {
    if (token_.empty())
        throw MalformedGrammar("empty terminal for " + lhs->ToStr());
}

std::string Rule::ToStr() const {
    std::stringstream res;
    res << lhs_ << lhs_features_->ToStr() << " ->";
    if (IsLexical())
        res << " '" << token_ << "'";
    for (unsigned i = 0; i < rhs_.size(); i++)
        res << " " << rhs_[i] << rhs_features_[i]->ToStr();
    return res.str();
}

Grammar Grammar::Load(const std::vector<RuleType>& rules, Cat start) {
    if (rules.empty())
        throw MalformedGrammar("no rules");
    Grammar res;
    res.rules_ = rules;
    res.start_ = start ? start : rules[0]->GetLhs();
    for (auto&& rule: rules) {
        CheckSemantics(*rule, rule->GetLhsFeatures());
        for (auto&& fs: rule->GetRhsFeatures())
            CheckSemantics(*rule, fs);

        res.by_lhs_[rule->GetLhs()].push_back(rule);
        for (auto&& feature: rule->GetLhsFeatures()->GetFeatures())
            res.features_[rule->GetLhs()].insert(feature.first);
        for (unsigned i = 0; i < rule->Arity(); i++) {
            for (auto&& feature: rule->GetRhsFeatures()[i]->GetFeatures())
                res.features_[rule->GetRhs()[i]].insert(feature.first);
        }
        if (rule->IsLexical())
            res.lexical_[rule->GetToken()].push_back(rule);
        else if (rule->IsUnary())
            res.unary_[rule->GetRhs()[0]].push_back(rule);
        else
            res.nary_[rule->GetRhs()[0]].push_back(rule);
    }
    for (auto&& rule: rules) {
        for (Cat cat: rule->GetRhs()) {
            if (! res.HasCategory(cat))
                throw MalformedGrammar("category " + cat->ToStr() +
                        " is never built by any rule: " + rule->ToStr());
        }
    }
    if (! res.HasCategory(res.start_))
        throw MalformedGrammar("no rule for the start category " + res.start_->ToStr());
    return res;
}

const std::vector<RuleType>& Grammar::RulesFor(Cat cat) const {
    return Find(by_lhs_, cat);
}

const std::vector<RuleType>& Grammar::LexicalRules(const std::string& token) const {
    return Find(lexical_, token);
}

const std::vector<RuleType>& Grammar::UnaryRules(Cat cat) const {
    return Find(unary_, cat);
}

const std::vector<RuleType>& Grammar::NaryRules(Cat cat) const {
    return Find(nary_, cat);
}

const std::set<std::string>& Grammar::FeaturesOf(Cat cat) const {
    auto it = features_.find(cat);
    return it == features_.end() ? kNoFeatures : it->second;
}

} // namespace semchart
