
#ifndef INCLUDE_SEMCHART_TERM_H_
#define INCLUDE_SEMCHART_TERM_H_

#include <set>
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <iostream>
#include "debug.h"

namespace semchart {

class Term;
typedef std::shared_ptr<const Term> TermType;

enum TermKind {
    VARIABLE    = 0,
    CONSTANT    = 1,
    META        = 2,
    APPLICATION = 3,
    LAMBDA      = 4,
    NEGATION    = 5,
    BINARY      = 6,
    QUANTIFIED  = 7
};

// ?name unifies like any feature variable, @name is a binding placeholder
// that the instantiator turns into a fresh logic variable
enum MetaKind { ORDINARY, PLACEHOLDER };

enum Connective { AND, OR, IMP, IFF, EQ, NEQ };

enum Quantifier { EXISTS, ALL };

enum ReductionOrder { NORMAL_ORDER, APPLICATIVE_ORDER };

const unsigned kDefaultMaxSteps = 10000;

class Term
{
public:
    static TermType Parse(const std::string& string);

    static TermType Var(const std::string& name);
    static TermType Const(const std::string& name);
    static TermType Meta(MetaKind kind, const std::string& name);
    static TermType App(TermType function, TermType argument);
    static TermType Lam(const std::string& variable, TermType body);
    static TermType Not(TermType body);
    static TermType Bin(Connective op, TermType left, TermType right);
    static TermType Quant(Quantifier quantifier, const std::string& variable, TermType body);

    virtual ~Term() {}

    virtual TermKind GetKind() const = 0;
    virtual std::string ToStr() const = 0;
    virtual bool Equals(const Term* other) const = 0;

    virtual const std::string& GetName() const NO_IMPLEMENTATION
    virtual MetaKind GetMetaKind() const NO_IMPLEMENTATION
    virtual TermType GetFunction() const NO_IMPLEMENTATION
    virtual TermType GetArgument() const NO_IMPLEMENTATION
    virtual TermType GetBody() const NO_IMPLEMENTATION
    virtual TermType GetLeft() const NO_IMPLEMENTATION
    virtual TermType GetRight() const NO_IMPLEMENTATION
    virtual Connective GetConnective() const NO_IMPLEMENTATION
    virtual Quantifier GetQuantifier() const NO_IMPLEMENTATION

    bool IsVariable() const { return GetKind() == VARIABLE; }
    bool IsConstant() const { return GetKind() == CONSTANT; }
    bool IsMeta() const { return GetKind() == META; }
    bool IsApplication() const { return GetKind() == APPLICATION; }
    bool IsLambda() const { return GetKind() == LAMBDA; }
    bool IsPlaceholder() const { return IsMeta() && GetMetaKind() == PLACEHOLDER; }

    // variables, constants and metavariables print without brackets
    bool IsAtomic() const { return GetKind() <= META; }

    // lambdas and quantifiers bind the name returned by GetName()
    bool IsBinder() const { return GetKind() == LAMBDA || GetKind() == QUANTIFIED; }

    friend std::ostream& operator<<(std::ostream& ost, const TermType& term) {
        ost << term->ToStr();
        return ost;
    }
};

class Variable: public Term
{
public:
    Variable(const std::string& name): name_(name) {}

    TermKind GetKind() const { return VARIABLE; }
    std::string ToStr() const { return name_; }
    bool Equals(const Term* other) const {
        return other->GetKind() == VARIABLE && other->GetName() == name_;
    }
    const std::string& GetName() const { return name_; }

private:
    std::string name_;
};

class Constant: public Term
{
public:
    Constant(const std::string& name): name_(name) {}

    TermKind GetKind() const { return CONSTANT; }
    std::string ToStr() const { return name_; }
    bool Equals(const Term* other) const {
        return other->GetKind() == CONSTANT && other->GetName() == name_;
    }
    const std::string& GetName() const { return name_; }

private:
    std::string name_;
};

class MetaVariable: public Term
{
public:
    MetaVariable(MetaKind kind, const std::string& name): kind_(kind), name_(name) {}

    TermKind GetKind() const { return META; }
    std::string ToStr() const { return (kind_ == PLACEHOLDER ? "@" : "?") + name_; }
    bool Equals(const Term* other) const {
        return (other->GetKind() == META &&
                other->GetMetaKind() == kind_ &&
                other->GetName() == name_);
    }
    const std::string& GetName() const { return name_; }
    MetaKind GetMetaKind() const { return kind_; }

private:
    MetaKind kind_;
    std::string name_;
};

class Application: public Term
{
public:
    Application(TermType function, TermType argument)
        : function_(function), argument_(argument) {}

    TermKind GetKind() const { return APPLICATION; }
    std::string ToStr() const;
    bool Equals(const Term* other) const {
        return (other->GetKind() == APPLICATION &&
                function_->Equals(other->GetFunction().get()) &&
                argument_->Equals(other->GetArgument().get()));
    }
    TermType GetFunction() const { return function_; }
    TermType GetArgument() const { return argument_; }

private:
    TermType function_;
    TermType argument_;
};

class Lambda: public Term
{
public:
    Lambda(const std::string& variable, TermType body)
        : variable_(variable), body_(body) {}

    TermKind GetKind() const { return LAMBDA; }
    std::string ToStr() const;
    bool Equals(const Term* other) const {
        return (other->GetKind() == LAMBDA &&
                other->GetName() == variable_ &&
                body_->Equals(other->GetBody().get()));
    }
    const std::string& GetName() const { return variable_; }
    TermType GetBody() const { return body_; }

private:
    std::string variable_;
    TermType body_;
};

class Negation: public Term
{
public:
    Negation(TermType body): body_(body) {}

    TermKind GetKind() const { return NEGATION; }
    std::string ToStr() const { return "-" + body_->ToStr(); }
    bool Equals(const Term* other) const {
        return other->GetKind() == NEGATION && body_->Equals(other->GetBody().get());
    }
    TermType GetBody() const { return body_; }

private:
    TermType body_;
};

class BinaryExpression: public Term
{
public:
    BinaryExpression(Connective op, TermType left, TermType right)
        : op_(op), left_(left), right_(right) {}

    TermKind GetKind() const { return BINARY; }
    std::string ToStr() const;
    bool Equals(const Term* other) const {
        return (other->GetKind() == BINARY &&
                other->GetConnective() == op_ &&
                left_->Equals(other->GetLeft().get()) &&
                right_->Equals(other->GetRight().get()));
    }
    Connective GetConnective() const { return op_; }
    TermType GetLeft() const { return left_; }
    TermType GetRight() const { return right_; }

private:
    Connective op_;
    TermType left_;
    TermType right_;
};

class QuantifiedExpression: public Term
{
public:
    QuantifiedExpression(Quantifier quantifier, const std::string& variable, TermType body)
        : quantifier_(quantifier), variable_(variable), body_(body) {}

    TermKind GetKind() const { return QUANTIFIED; }
    std::string ToStr() const;
    bool Equals(const Term* other) const {
        return (other->GetKind() == QUANTIFIED &&
                other->GetQuantifier() == quantifier_ &&
                other->GetName() == variable_ &&
                body_->Equals(other->GetBody().get()));
    }
    const std::string& GetName() const { return variable_; }
    Quantifier GetQuantifier() const { return quantifier_; }
    TermType GetBody() const { return body_; }

private:
    Quantifier quantifier_;
    std::string variable_;
    TermType body_;
};

std::string ConnectiveToStr(Connective op);

// functor(arg)
TermType Apply(TermType functor, TermType arg);

// functor(arg1)(arg2)...; how `feed(x,y)` is represented
TermType Apply(TermType functor, const std::vector<TermType>& args);

// replace the free occurrences of the logic variable `var`, renaming binders
// that would capture a free variable of `replacement`
TermType Substitute(TermType term, const std::string& var, TermType replacement);

// beta-reduce to normal form. throws NonTerminatingReduction once
// `max_steps` contractions have been performed without reaching it.
TermType Reduce(TermType term,
                unsigned max_steps = kDefaultMaxSteps,
                ReductionOrder order = NORMAL_ORDER);

std::set<std::string> FreeVariables(TermType term);

// every variable and constant name, bound or free
std::set<std::string> Names(TermType term);

// `base` with its trailing digits replaced by the smallest counter not in `avoid`
std::string FreshName(const std::string& base, const std::set<std::string>& avoid);

bool AlphaEquivalent(TermType term1, TermType term2);

// rebuild `term`, replacing each metavariable for which `replace` sets `*out`.
// returns nullptr as soon as `replace` returns false.
typedef std::function<bool(const Term*, TermType*)> MetaReplacer;
TermType MapMeta(TermType term, const MetaReplacer& replace);

void CollectMeta(TermType term, std::vector<const Term*>* out);

} // namespace semchart

#endif
