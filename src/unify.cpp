
#include <algorithm>
#include "unify.h"
#include "instantiate.h"

namespace semchart {

namespace {

Value MakeVariable(const std::string& name) {
    return std::make_shared<const VariableValue>(name);
}

// <?x> in a feature position behaves exactly like ?x
bool IsBareMeta(const Value& value) {
    return value->IsTerm() && value->GetTerm()->IsMeta() &&
           value->GetTerm()->GetMetaKind() == ORDINARY;
}

// follow bound variables until an unbound variable or a non-variable
Value Walk(Value value, const Bindings& bindings) {
    while (true) {
        if (IsBareMeta(value))
            value = MakeVariable(value->GetTerm()->GetName());
        if (! value->IsVariable())
            return value;
        Value bound = bindings.Lookup(value->GetName());
        if (! bound)
            return value;
        value = bound;
    }
}

// the term a bound metavariable stands for; nullptr when it is bound to
// something that cannot appear inside a term
TermType WalkTerm(TermType term, const Bindings& bindings) {
    while (term->IsMeta() && term->GetMetaKind() == ORDINARY) {
        Value bound = bindings.Lookup(term->GetName());
        if (! bound)
            return term;
        switch (bound->GetType()) {
            case TERM_VALUE:
                term = bound->GetTerm();
                break;
            case ATOM_VALUE:
                return Term::Const(bound->GetName());
            case VAR_VALUE:
                term = Term::Meta(ORDINARY, bound->GetName());
                break;
            default:
                return nullptr;
        }
    }
    return term;
}

bool OccursInTerm(const std::string& name, TermType term, const Bindings& bindings) {
    std::vector<const Term*> metas;
    CollectMeta(term, &metas);
    for (const Term* meta: metas) {
        if (meta->GetMetaKind() != ORDINARY)
            continue;
        if (meta->GetName() == name)
            return true;
        Value bound = bindings.Lookup(meta->GetName());
        if (bound && Occurs(name, bound, bindings))
            return true;
    }
    return false;
}

Value MergeSets(const Value& set1, const Value& set2) {
    std::vector<TermType> elements(set1->GetElements());
    elements.insert(elements.end(),
            set2->GetElements().begin(), set2->GetElements().end());
    std::vector<std::string> pending(set1->GetPending());
    pending.insert(pending.end(),
            set2->GetPending().begin(), set2->GetPending().end());
    return std::make_shared<const SetValue>(elements, pending);
}

Value UnifyStructs(const FeatStruct& fs1, const FeatStruct& fs2, Bindings* bindings) {
    FeatStruct::Features features(fs1.GetFeatures());
    for (auto&& feature: fs2.GetFeatures()) {
        auto it = features.find(feature.first);
        if (it == features.end()) {
            features.emplace(feature.first, feature.second);
            continue;
        }
        Value unified = Unify(it->second, feature.second, bindings);
        if (! unified)
            return nullptr;
        it->second = unified;
    }
    return std::make_shared<const FeatStruct>(features);
}

// resolve the pending unions of a set: bound set variables contribute their
// members, unbound ones stay pending
bool ResolveSet(const Value& set, const Bindings& bindings,
        std::vector<TermType>* elements, std::vector<std::string>* pending,
        std::vector<std::string>* visiting) {
    for (auto&& element: set->GetElements()) {
        TermType term = SubstituteTerm(element, bindings);
        if (! term)
            return false;
        elements->push_back(term);
    }
    for (auto&& var: set->GetPending()) {
        if (std::find(visiting->begin(), visiting->end(), var) != visiting->end())
            continue;
        Value bound = Walk(MakeVariable(var), bindings);
        switch (bound->GetType()) {
            case VAR_VALUE:
                pending->push_back(bound->GetName());
                break;
            case SET_VALUE:
                visiting->push_back(var);
                if (! ResolveSet(bound, bindings, elements, pending, visiting))
                    return false;
                visiting->pop_back();
                break;
            case TERM_VALUE: {
                TermType term = SubstituteTerm(bound->GetTerm(), bindings);
                if (! term)
                    return false;
                elements->push_back(term);
                break;
            }
            default:
                return false;
        }
    }
    return true;
}

std::string Renamed(const std::string& name,
        std::unordered_map<std::string, std::string>* renaming) {
    auto it = renaming->find(name);
    if (it != renaming->end())
        return it->second;
    std::string fresh = name + "_" + std::to_string(NextFreshId());
    renaming->emplace(name, fresh);
    return fresh;
}

TermType RenameTerm(TermType term,
        std::unordered_map<std::string, std::string>* renaming) {
    return MapMeta(term,
            [renaming] (const Term* meta, TermType* out) -> bool {
                if (meta->GetMetaKind() == ORDINARY)
                    *out = Term::Meta(ORDINARY, Renamed(meta->GetName(), renaming));
                return true;
            });
}

} // namespace

Value Bindings::Lookup(const std::string& name) const {
    auto it = bindings_.find(name);
    return it == bindings_.end() ? nullptr : it->second;
}

bool Occurs(const std::string& name, Value value, const Bindings& bindings) {
    value = Walk(value, bindings);
    switch (value->GetType()) {
        case ATOM_VALUE:
            return false;
        case VAR_VALUE:
            return value->GetName() == name;
        case TERM_VALUE:
            return OccursInTerm(name, value->GetTerm(), bindings);
        case SET_VALUE:
            for (auto&& element: value->GetElements()) {
                if (OccursInTerm(name, element, bindings))
                    return true;
            }
            for (auto&& var: value->GetPending()) {
                if (Occurs(name, MakeVariable(var), bindings))
                    return true;
            }
            return false;
        case STRUCT_VALUE:
            for (auto&& feature: value->AsStruct().GetFeatures()) {
                if (Occurs(name, feature.second, bindings))
                    return true;
            }
            return false;
    }
    return false;
}

TermType UnifyTerms(TermType term1, TermType term2, Bindings* bindings) {
    term1 = WalkTerm(term1, *bindings);
    term2 = WalkTerm(term2, *bindings);
    if (! term1 || ! term2)
        return nullptr;
    bool var1 = term1->IsMeta() && term1->GetMetaKind() == ORDINARY;
    bool var2 = term2->IsMeta() && term2->GetMetaKind() == ORDINARY;
    if (var1 && var2 && term1->GetName() == term2->GetName())
        return term1;
    if (var1 && var2 && term1->GetName() < term2->GetName())
        std::swap(term1, term2);
    if (var1) {
        if (OccursInTerm(term1->GetName(), term2, *bindings))
            return nullptr;
        bindings->Bind(term1->GetName(), std::make_shared<const TermValue>(term2));
        return term2;
    }
    if (var2) {
        if (OccursInTerm(term2->GetName(), term1, *bindings))
            return nullptr;
        bindings->Bind(term2->GetName(), std::make_shared<const TermValue>(term1));
        return term1;
    }
    if (term1->GetKind() != term2->GetKind())
        return nullptr;
    switch (term1->GetKind()) {
        case VARIABLE:
        case CONSTANT:
        case META:
            return term1->Equals(term2.get()) ? term1 : nullptr;
        case APPLICATION: {
            TermType function = UnifyTerms(term1->GetFunction(), term2->GetFunction(), bindings);
            if (! function) return nullptr;
            TermType argument = UnifyTerms(term1->GetArgument(), term2->GetArgument(), bindings);
            if (! argument) return nullptr;
            return Term::App(function, argument);
        }
        case NEGATION: {
            TermType body = UnifyTerms(term1->GetBody(), term2->GetBody(), bindings);
            return body ? Term::Not(body) : nullptr;
        }
        case BINARY: {
            if (term1->GetConnective() != term2->GetConnective())
                return nullptr;
            TermType left = UnifyTerms(term1->GetLeft(), term2->GetLeft(), bindings);
            if (! left) return nullptr;
            TermType right = UnifyTerms(term1->GetRight(), term2->GetRight(), bindings);
            if (! right) return nullptr;
            return Term::Bin(term1->GetConnective(), left, right);
        }
        case LAMBDA:
        case QUANTIFIED: {
            if (term1->GetName() != term2->GetName())
                return nullptr;
            if (term1->GetKind() == QUANTIFIED &&
                    term1->GetQuantifier() != term2->GetQuantifier())
                return nullptr;
            TermType body = UnifyTerms(term1->GetBody(), term2->GetBody(), bindings);
            if (! body)
                return nullptr;
            return term1->IsLambda() ? Term::Lam(term1->GetName(), body)
                : Term::Quant(term1->GetQuantifier(), term1->GetName(), body);
        }
    }
    return nullptr;
}

Value Unify(Value value1, Value value2, Bindings* bindings) {
    value1 = Walk(value1, *bindings);
    value2 = Walk(value2, *bindings);
    // two variables: the lexically smaller name survives
    if (value1->IsVariable() && value2->IsVariable() &&
            value1->GetName() < value2->GetName())
        std::swap(value1, value2);
    if (value1->IsVariable()) {
        if (value2->IsVariable() && value1->GetName() == value2->GetName())
            return value1;
        if (Occurs(value1->GetName(), value2, *bindings))
            return nullptr;
        bindings->Bind(value1->GetName(), value2);
        return value2;
    }
    if (value2->IsVariable()) {
        if (Occurs(value2->GetName(), value1, *bindings))
            return nullptr;
        bindings->Bind(value2->GetName(), value1);
        return value1;
    }

    // an atom meets a term only as a same-named constant
    if (value1->IsAtom() && value2->IsTerm())
        std::swap(value1, value2);
    if (value1->IsTerm() && value2->IsAtom()) {
        TermType term = UnifyTerms(value1->GetTerm(),
                Term::Const(value2->GetName()), bindings);
        return term ? value1 : nullptr;
    }

    if (value1->GetType() != value2->GetType())
        return nullptr;
    switch (value1->GetType()) {
        case ATOM_VALUE:
            return value1->Equals(value2.get()) ? value1 : nullptr;
        case TERM_VALUE: {
            TermType term = UnifyTerms(value1->GetTerm(), value2->GetTerm(), bindings);
            return term ? std::make_shared<const TermValue>(term) : nullptr;
        }
        case SET_VALUE:
            return MergeSets(value1, value2);
        case STRUCT_VALUE:
            return UnifyStructs(value1->AsStruct(), value2->AsStruct(), bindings);
        case VAR_VALUE:
            break;
    }
    return nullptr;
}

Value Unify(Value value1, Value value2) {
    Bindings bindings;
    Value res = Unify(value1, value2, &bindings);
    return res ? Substitute(res, bindings) : nullptr;
}

TermType SubstituteTerm(TermType term, const Bindings& bindings) {
    return MapMeta(term,
            [&bindings] (const Term* meta, TermType* out) -> bool {
                if (meta->GetMetaKind() != ORDINARY)
                    return true;
                Value bound = bindings.Lookup(meta->GetName());
                if (! bound)
                    return true;
                Value value = Substitute(bound, bindings);
                if (! value)
                    return false;
                switch (value->GetType()) {
                    case TERM_VALUE:
                        *out = value->GetTerm();
                        return true;
                    case ATOM_VALUE:
                        *out = Term::Const(value->GetName());
                        return true;
                    case VAR_VALUE:
                        *out = Term::Meta(ORDINARY, value->GetName());
                        return true;
                    default:
                        return false;
                }
            });
}

Value Substitute(Value value, const Bindings& bindings) {
    if (IsBareMeta(value)) {
        Value resolved = Walk(value, bindings);
        if (resolved->IsVariable())
            return value->GetTerm()->GetName() == resolved->GetName()
                ? value : std::make_shared<const TermValue>(
                        Term::Meta(ORDINARY, resolved->GetName()));
        return Substitute(resolved, bindings);
    }
    switch (value->GetType()) {
        case ATOM_VALUE:
            return value;
        case VAR_VALUE: {
            Value resolved = Walk(value, bindings);
            return resolved->IsVariable() ? resolved : Substitute(resolved, bindings);
        }
        case TERM_VALUE: {
            TermType term = SubstituteTerm(value->GetTerm(), bindings);
            return term ? std::make_shared<const TermValue>(term) : nullptr;
        }
        case SET_VALUE: {
            std::vector<TermType> elements;
            std::vector<std::string> pending;
            std::vector<std::string> visiting;
            if (! ResolveSet(value, bindings, &elements, &pending, &visiting))
                return nullptr;
            return std::make_shared<const SetValue>(elements, pending);
        }
        case STRUCT_VALUE: {
            FeatStruct::Features features;
            for (auto&& feature: value->AsStruct().GetFeatures()) {
                Value substituted = Substitute(feature.second, bindings);
                if (! substituted)
                    return nullptr;
                features.emplace(feature.first, substituted);
            }
            return std::make_shared<const FeatStruct>(features);
        }
    }
    return nullptr;
}

Value RenameApart(Value value, std::unordered_map<std::string, std::string>* renaming) {
    switch (value->GetType()) {
        case ATOM_VALUE:
            return value;
        case VAR_VALUE:
            return MakeVariable(Renamed(value->GetName(), renaming));
        case TERM_VALUE:
            return std::make_shared<const TermValue>(RenameTerm(value->GetTerm(), renaming));
        case SET_VALUE: {
            std::vector<TermType> elements;
            for (auto&& element: value->GetElements())
                elements.push_back(RenameTerm(element, renaming));
            std::vector<std::string> pending;
            for (auto&& var: value->GetPending())
                pending.push_back(Renamed(var, renaming));
            return std::make_shared<const SetValue>(elements, pending);
        }
        case STRUCT_VALUE: {
            FeatStruct::Features features;
            for (auto&& feature: value->AsStruct().GetFeatures())
                features.emplace(feature.first, RenameApart(feature.second, renaming));
            return std::make_shared<const FeatStruct>(features);
        }
    }
    return value;
}

} // namespace semchart
