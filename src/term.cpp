
#include <deque>
#include <sstream>
#include "term.h"
#include "errors.h"

namespace semchart {

TermType Term::Var(const std::string& name) {
    return std::make_shared<const Variable>(name);
}

TermType Term::Const(const std::string& name) {
    return std::make_shared<const Constant>(name);
}

TermType Term::Meta(MetaKind kind, const std::string& name) {
    return std::make_shared<const MetaVariable>(kind, name);
}

TermType Term::App(TermType function, TermType argument) {
    return std::make_shared<const Application>(function, argument);
}

TermType Term::Lam(const std::string& variable, TermType body) {
    return std::make_shared<const Lambda>(variable, body);
}

TermType Term::Not(TermType body) {
    return std::make_shared<const Negation>(body);
}

TermType Term::Bin(Connective op, TermType left, TermType right) {
    return std::make_shared<const BinaryExpression>(op, left, right);
}

TermType Term::Quant(Quantifier quantifier, const std::string& variable, TermType body) {
    return std::make_shared<const QuantifiedExpression>(quantifier, variable, body);
}

std::string ConnectiveToStr(Connective op) {
    switch (op) {
        case AND: return "&";
        case OR:  return "|";
        case IMP: return "->";
        case IFF: return "<->";
        case EQ:  return "=";
        case NEQ: return "!=";
    }
    return "?";
}

// P(x,y) rather than P(x)(y)
std::string Application::ToStr() const {
    std::deque<TermType> args;
    const Term* head = this;
    while (head->IsApplication()) {
        args.push_front(head->GetArgument());
        head = head->GetFunction().get();
    }
    std::stringstream res;
    if (head->IsAtomic())
        res << head->ToStr();
    else
        res << "(" << head->ToStr() << ")";
    res << "(";
    for (unsigned i = 0; i < args.size(); i++) {
        if (i > 0) res << ",";
        res << args[i]->ToStr();
    }
    res << ")";
    return res.str();
}

// \x y.body for directly nested lambdas
std::string Lambda::ToStr() const {
    std::string res = "\\" + variable_;
    TermType body = body_;
    while (body->IsLambda()) {
        res += " " + body->GetName();
        body = body->GetBody();
    }
    return res + "." + body->ToStr();
}

namespace {

// a binder's scope runs to the end of the enclosing group, so a binder
// (possibly negated) needs brackets when something follows it
bool ExtendsRight(const Term* term) {
    while (term->GetKind() == NEGATION)
        term = term->GetBody().get();
    return term->IsBinder();
}

} // namespace

std::string BinaryExpression::ToStr() const {
    std::string left = left_->ToStr();
    if (ExtendsRight(left_.get()))
        left = "(" + left + ")";
    return "(" + left + " " + ConnectiveToStr(op_) + " " + right_->ToStr() + ")";
}

std::string QuantifiedExpression::ToStr() const {
    return (quantifier_ == EXISTS ? "exists " : "all ") + variable_ + "." + body_->ToStr();
}

TermType Apply(TermType functor, TermType arg) {
    return Term::App(functor, arg);
}

TermType Apply(TermType functor, const std::vector<TermType>& args) {
    TermType res = functor;
    for (auto&& arg: args)
        res = Term::App(res, arg);
    return res;
}

namespace {

// same node with new children; binders keep their kind and quantifier
TermType Rebuild(const Term* term, const std::string& name, TermType body) {
    if (term->IsLambda())
        return Term::Lam(name, body);
    return Term::Quant(term->GetQuantifier(), name, body);
}

void CollectFree(TermType term, std::set<std::string>& bound,
        std::set<std::string>* out) {
    switch (term->GetKind()) {
        case VARIABLE:
            if (bound.count(term->GetName()) == 0)
                out->insert(term->GetName());
            break;
        case CONSTANT:
        case META:
            break;
        case APPLICATION:
            CollectFree(term->GetFunction(), bound, out);
            CollectFree(term->GetArgument(), bound, out);
            break;
        case NEGATION:
            CollectFree(term->GetBody(), bound, out);
            break;
        case BINARY:
            CollectFree(term->GetLeft(), bound, out);
            CollectFree(term->GetRight(), bound, out);
            break;
        case LAMBDA:
        case QUANTIFIED: {
            bool shadowing = bound.count(term->GetName()) > 0;
            bound.insert(term->GetName());
            CollectFree(term->GetBody(), bound, out);
            if (! shadowing)
                bound.erase(term->GetName());
            break;
        }
    }
}

void CollectNames(TermType term, std::set<std::string>* out) {
    switch (term->GetKind()) {
        case VARIABLE:
        case CONSTANT:
            out->insert(term->GetName());
            break;
        case META:
            break;
        case APPLICATION:
            CollectNames(term->GetFunction(), out);
            CollectNames(term->GetArgument(), out);
            break;
        case NEGATION:
            CollectNames(term->GetBody(), out);
            break;
        case BINARY:
            CollectNames(term->GetLeft(), out);
            CollectNames(term->GetRight(), out);
            break;
        case LAMBDA:
        case QUANTIFIED:
            out->insert(term->GetName());
            CollectNames(term->GetBody(), out);
            break;
    }
}

} // namespace

std::set<std::string> FreeVariables(TermType term) {
    std::set<std::string> bound, res;
    CollectFree(term, bound, &res);
    return res;
}

std::set<std::string> Names(TermType term) {
    std::set<std::string> res;
    CollectNames(term, &res);
    return res;
}

std::string FreshName(const std::string& base, const std::set<std::string>& avoid) {
    std::string stem = base.substr(0, base.find_last_not_of("0123456789") + 1);
    if (stem.empty())
        stem = "z";
    for (unsigned i = 1; ; i++) {
        std::string name = stem + std::to_string(i);
        if (avoid.count(name) == 0)
            return name;
    }
}

TermType Substitute(TermType term, const std::string& var, TermType replacement) {
    switch (term->GetKind()) {
        case VARIABLE:
            return term->GetName() == var ? replacement : term;
        case CONSTANT:
        case META:
            return term;
        case APPLICATION:
            return Term::App(Substitute(term->GetFunction(), var, replacement),
                             Substitute(term->GetArgument(), var, replacement));
        case NEGATION:
            return Term::Not(Substitute(term->GetBody(), var, replacement));
        case BINARY:
            return Term::Bin(term->GetConnective(),
                             Substitute(term->GetLeft(), var, replacement),
                             Substitute(term->GetRight(), var, replacement));
        case LAMBDA:
        case QUANTIFIED: {
            const std::string& bound = term->GetName();
            TermType body = term->GetBody();
            if (bound == var || FreeVariables(body).count(var) == 0)
                return term;
            if (FreeVariables(replacement).count(bound) > 0) {
                std::set<std::string> avoid = Names(body);
                std::set<std::string> in_replacement = Names(replacement);
                avoid.insert(in_replacement.begin(), in_replacement.end());
                avoid.insert(var);
                std::string renamed = FreshName(bound, avoid);
                body = Substitute(body, bound, Term::Var(renamed));
                return Rebuild(term.get(), renamed, Substitute(body, var, replacement));
            }
            return Rebuild(term.get(), bound, Substitute(body, var, replacement));
        }
    }
    return term;
}

namespace {

// one contraction. false when `term` is already in normal form.
bool Step(TermType term, ReductionOrder order, TermType* out) {
    TermType tmp;
    switch (term->GetKind()) {
        case VARIABLE:
        case CONSTANT:
        case META:
            return false;
        case APPLICATION: {
            TermType function = term->GetFunction();
            TermType argument = term->GetArgument();
            if (order == NORMAL_ORDER && function->IsLambda()) {
                *out = Substitute(function->GetBody(), function->GetName(), argument);
                return true;
            }
            if (Step(function, order, &tmp)) {
                *out = Term::App(tmp, argument);
                return true;
            }
            if (Step(argument, order, &tmp)) {
                *out = Term::App(function, tmp);
                return true;
            }
            if (function->IsLambda()) {
                *out = Substitute(function->GetBody(), function->GetName(), argument);
                return true;
            }
            return false;
        }
        case NEGATION:
            if (Step(term->GetBody(), order, &tmp)) {
                *out = Term::Not(tmp);
                return true;
            }
            return false;
        case BINARY:
            if (Step(term->GetLeft(), order, &tmp)) {
                *out = Term::Bin(term->GetConnective(), tmp, term->GetRight());
                return true;
            }
            if (Step(term->GetRight(), order, &tmp)) {
                *out = Term::Bin(term->GetConnective(), term->GetLeft(), tmp);
                return true;
            }
            return false;
        case LAMBDA:
        case QUANTIFIED:
            if (Step(term->GetBody(), order, &tmp)) {
                *out = Rebuild(term.get(), term->GetName(), tmp);
                return true;
            }
            return false;
    }
    return false;
}

bool AlphaEq(const Term* t1, const Term* t2,
        std::vector<std::pair<std::string, std::string>>& env) {
    if (t1->GetKind() != t2->GetKind())
        return false;
    switch (t1->GetKind()) {
        case VARIABLE: {
            for (int i = env.size() - 1; i >= 0; i--) {
                bool left = env[i].first == t1->GetName();
                bool right = env[i].second == t2->GetName();
                if (left || right)
                    return left && right;
            }
            return t1->GetName() == t2->GetName();
        }
        case CONSTANT:
        case META:
            return t1->Equals(t2);
        case APPLICATION:
            return (AlphaEq(t1->GetFunction().get(), t2->GetFunction().get(), env) &&
                    AlphaEq(t1->GetArgument().get(), t2->GetArgument().get(), env));
        case NEGATION:
            return AlphaEq(t1->GetBody().get(), t2->GetBody().get(), env);
        case BINARY:
            return (t1->GetConnective() == t2->GetConnective() &&
                    AlphaEq(t1->GetLeft().get(), t2->GetLeft().get(), env) &&
                    AlphaEq(t1->GetRight().get(), t2->GetRight().get(), env));
        case QUANTIFIED:
            if (t1->GetQuantifier() != t2->GetQuantifier())
                return false;
            // fall through
        case LAMBDA: {
            env.emplace_back(t1->GetName(), t2->GetName());
            bool res = AlphaEq(t1->GetBody().get(), t2->GetBody().get(), env);
            env.pop_back();
            return res;
        }
    }
    return false;
}

} // namespace

TermType Reduce(TermType term, unsigned max_steps, ReductionOrder order) {
    TermType current = term, next;
    unsigned steps = 0;
    while (Step(current, order, &next)) {
        if (++steps > max_steps)
            throw NonTerminatingReduction(term->ToStr(), max_steps);
        current = next;
    }
    return current;
}

bool AlphaEquivalent(TermType term1, TermType term2) {
    std::vector<std::pair<std::string, std::string>> env;
    return AlphaEq(term1.get(), term2.get(), env);
}

TermType MapMeta(TermType term, const MetaReplacer& replace) {
    TermType left, right;
    switch (term->GetKind()) {
        case VARIABLE:
        case CONSTANT:
            return term;
        case META: {
            TermType res;
            if (! replace(term.get(), &res))
                return nullptr;
            return res ? res : term;
        }
        case APPLICATION:
            if (! (left = MapMeta(term->GetFunction(), replace)) ||
                    ! (right = MapMeta(term->GetArgument(), replace)))
                return nullptr;
            return Term::App(left, right);
        case NEGATION:
            if (! (left = MapMeta(term->GetBody(), replace)))
                return nullptr;
            return Term::Not(left);
        case BINARY:
            if (! (left = MapMeta(term->GetLeft(), replace)) ||
                    ! (right = MapMeta(term->GetRight(), replace)))
                return nullptr;
            return Term::Bin(term->GetConnective(), left, right);
        case LAMBDA:
        case QUANTIFIED:
            if (! (left = MapMeta(term->GetBody(), replace)))
                return nullptr;
            return Rebuild(term.get(), term->GetName(), left);
    }
    return term;
}

void CollectMeta(TermType term, std::vector<const Term*>* out) {
    switch (term->GetKind()) {
        case VARIABLE:
        case CONSTANT:
            break;
        case META:
            out->push_back(term.get());
            break;
        case APPLICATION:
            CollectMeta(term->GetFunction(), out);
            CollectMeta(term->GetArgument(), out);
            break;
        case BINARY:
            CollectMeta(term->GetLeft(), out);
            CollectMeta(term->GetRight(), out);
            break;
        case NEGATION:
        case LAMBDA:
        case QUANTIFIED:
            CollectMeta(term->GetBody(), out);
            break;
    }
}

} // namespace semchart
