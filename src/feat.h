
#ifndef INCLUDE_SEMCHART_FEAT_H_
#define INCLUDE_SEMCHART_FEAT_H_

#include <map>
#include <string>
#include <vector>
#include <memory>
#include "term.h"
#include "debug.h"


namespace semchart {

class FeatureValue;
class FeatStruct;
typedef std::shared_ptr<const FeatureValue> Value;
typedef std::shared_ptr<const FeatStruct> FeatType;

// a dotted feature path such as SEM.CORE
typedef std::vector<std::string> FeaturePath;

enum ValueType {
    ATOM_VALUE     = 0,
    VAR_VALUE      = 1,
    STRUCT_VALUE   = 2,
    TERM_VALUE     = 3,
    SET_VALUE      = 4
};

// the semantic features recognized in grammars
extern const std::string kSem;
extern const std::string kCore;
extern const std::string kBo;
extern const FeaturePath kSemCore;
extern const FeaturePath kSemBo;

// functor of the members of SEM.BO: bo(expr, v)
extern const std::string kBindingOperator;

FeaturePath ParsePath(const std::string& path);

class FeatureValue
{
public:
    // one value in the bracketed notation: ?x, @x, <term>, [..], {..} or an atom
    static Value Parse(const std::string& string);

    virtual ~FeatureValue() {}
    virtual ValueType GetType() const = 0;
    virtual std::string ToStr() const = 0;
    virtual bool Equals(const FeatureValue* other) const = 0;

    virtual const std::string& GetName() const NO_IMPLEMENTATION
    virtual TermType GetTerm() const NO_IMPLEMENTATION
    virtual const std::vector<TermType>& GetElements() const NO_IMPLEMENTATION
    virtual const std::vector<std::string>& GetPending() const NO_IMPLEMENTATION

    bool IsAtom() const { return GetType() == ATOM_VALUE; }
    bool IsVariable() const { return GetType() == VAR_VALUE; }
    bool IsStruct() const { return GetType() == STRUCT_VALUE; }
    bool IsTerm() const { return GetType() == TERM_VALUE; }
    bool IsSet() const { return GetType() == SET_VALUE; }

    const FeatStruct& AsStruct() const;

    friend std::ostream& operator<<(std::ostream& ost, const Value& value) {
        ost << value->ToStr();
        return ost;
    }
};

class AtomValue: public FeatureValue
{
public:
    AtomValue(const std::string& name): name_(name) {}

    ValueType GetType() const { return ATOM_VALUE; }
    std::string ToStr() const { return name_; }
    bool Equals(const FeatureValue* other) const {
        return other->IsAtom() && other->GetName() == name_;
    }
    const std::string& GetName() const { return name_; }

private:
    std::string name_;
};

// ?name
class VariableValue: public FeatureValue
{
public:
    VariableValue(const std::string& name): name_(name) {}

    ValueType GetType() const { return VAR_VALUE; }
    std::string ToStr() const { return "?" + name_; }
    bool Equals(const FeatureValue* other) const {
        return other->IsVariable() && other->GetName() == name_;
    }
    const std::string& GetName() const { return name_; }

private:
    std::string name_;
};

// <term>
class TermValue: public FeatureValue
{
public:
    TermValue(TermType term): term_(term) {}

    ValueType GetType() const { return TERM_VALUE; }
    std::string ToStr() const { return "<" + term_->ToStr() + ">"; }
    bool Equals(const FeatureValue* other) const {
        return other->IsTerm() && term_->Equals(other->GetTerm().get());
    }
    TermType GetTerm() const { return term_; }

private:
    TermType term_;
};

// {<t1>, <t2>} possibly still waiting for the union with set variables,
// as in {<t1>}+?b1+?b2. elements are unique and keep insertion order.
class SetValue: public FeatureValue
{
public:
    SetValue(const std::vector<TermType>& elements,
             const std::vector<std::string>& pending = std::vector<std::string>());

    ValueType GetType() const { return SET_VALUE; }
    std::string ToStr() const;
    bool Equals(const FeatureValue* other) const;
    const std::vector<TermType>& GetElements() const { return elements_; }
    const std::vector<std::string>& GetPending() const { return pending_; }
    bool IsConcrete() const { return pending_.empty(); }
    bool Contains(TermType term) const;

private:
    std::vector<TermType> elements_;
    std::vector<std::string> pending_;
};

class FeatStruct: public FeatureValue
{
public:
    typedef std::map<std::string, Value> Features;

    // "[A=x, B=[C=?y]]"
    static FeatType Parse(const std::string& string);

    FeatStruct() {}
    FeatStruct(const Features& features): features_(features) {}

    ValueType GetType() const { return STRUCT_VALUE; }
    std::string ToStr() const;
    bool Equals(const FeatureValue* other) const;

    bool IsEmpty() const { return features_.empty(); }
    bool Has(const std::string& name) const { return features_.count(name) > 0; }
    const Features& GetFeatures() const { return features_; }

    // nullptr when the feature is absent
    Value Get(const std::string& name) const;
    Value Get(const FeaturePath& path) const;

private:
    Features features_;
};

// printed form with unbound variables renamed in order of first occurrence;
// two values that differ only in variable names print identically
std::string Canonical(Value value);

} // namespace semchart

#endif
