
#ifndef INCLUDE_SEMCHART_SEMANTICS_H_
#define INCLUDE_SEMCHART_SEMANTICS_H_

#include <string>
#include <vector>
#include "feat.h"
#include "term.h"
#include "tree.h"

namespace semchart {

// bo(expr, v): a quantifier `expr` waiting to take scope over the variable v
class BindingOperator
{
public:
    BindingOperator(TermType expr, const std::string& variable)
        : expr_(expr), variable_(variable) {}

    // `term` must have the form bo(expr, v) with v a logic variable.
    // throws CaptureHazard for a malformed operator or a leftover placeholder,
    // std::runtime_error when v was unified with something else.
    static BindingOperator FromTerm(TermType term);

    TermType GetExpr() const { return expr_; }
    const std::string& GetVariable() const { return variable_; }

    // expr(\v.core)
    TermType Apply(TermType core) const;

    std::string ToStr() const;

private:
    TermType expr_;
    std::string variable_;
};

// SEM.CORE of a complete edge, or SEM itself when it is a plain term
TermType GetCore(FeatType features);

// the members of SEM.BO in insertion order; empty when there is none
std::vector<BindingOperator> GetBindingOperators(FeatType features);

class SemanticsComposer
{
public:
    SemanticsComposer(unsigned max_steps = kDefaultMaxSteps,
                      ReductionOrder order = NORMAL_ORDER)
        : max_steps_(max_steps), order_(order) {}

    unsigned GetMaxSteps() const { return max_steps_; }

    // apply bos[order[0]] first, so that bos[order.back()] takes widest
    // scope, and reduce after each step
    TermType Compose(TermType core, const std::vector<BindingOperator>& bos,
                     const std::vector<unsigned>& order) const;

    // the reading with the operators applied in insertion order
    TermType Reading(EdgeType edge) const;

    // one reading per ordering of the operators: k! of them for k operators
    std::vector<TermType> Readings(EdgeType edge) const;

    // drops readings alpha-equivalent to an earlier one
    static std::vector<TermType> UniqueReadings(const std::vector<TermType>& readings);

private:
    unsigned max_steps_;
    ReductionOrder order_;
};

} // namespace semchart

#endif
