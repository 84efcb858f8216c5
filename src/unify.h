
#ifndef INCLUDE_SEMCHART_UNIFY_H_
#define INCLUDE_SEMCHART_UNIFY_H_

#include <string>
#include <unordered_map>
#include "feat.h"
#include "term.h"

namespace semchart {

// variable bindings accumulated while one rule is matched against its
// children. ?x in a feature position and ?x inside a term are the same variable.
class Bindings
{
public:
    Bindings() {}

    bool IsBound(const std::string& name) const { return bindings_.count(name) > 0; }
    Value Lookup(const std::string& name) const;
    void Bind(const std::string& name, Value value) { bindings_[name] = value; }
    unsigned Size() const { return bindings_.size(); }

private:
    std::unordered_map<std::string, Value> bindings_;
};

// most general unifier of `value1` and `value2`, recording variable bindings
// in `bindings`. returns nullptr when the two are incompatible; `bindings`
// is then unusable. inputs are never modified.
Value Unify(Value value1, Value value2, Bindings* bindings);

// unify with fresh bindings and apply them to the result
Value Unify(Value value1, Value value2);

// structural unification of two terms; ?x metavariables bind to subterms
TermType UnifyTerms(TermType term1, TermType term2, Bindings* bindings);

// apply `bindings` everywhere, including inside terms and pending set unions.
// nullptr when a variable in term position is bound to a structure or set.
Value Substitute(Value value, const Bindings& bindings);

TermType SubstituteTerm(TermType term, const Bindings& bindings);

// does variable `name` occur in `value` once bindings are followed
bool Occurs(const std::string& name, Value value, const Bindings& bindings);

// a copy of `value` whose ordinary variables carry fresh names. the same
// `renaming` must be passed for every part of one rule.
Value RenameApart(Value value, std::unordered_map<std::string, std::string>* renaming);

} // namespace semchart

#endif
