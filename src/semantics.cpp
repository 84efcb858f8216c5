
#include <algorithm>
#include <stdexcept>
#include "semantics.h"
#include "errors.h"

namespace semchart {

namespace {

void CheckNoPlaceholder(TermType term, const std::string& where) {
    std::vector<const Term*> metas;
    CollectMeta(term, &metas);
    for (const Term* meta: metas) {
        if (meta->GetMetaKind() == PLACEHOLDER)
            throw CaptureHazard("uninstantiated placeholder " + meta->ToStr() +
                    " in " + where + ": " + term->ToStr());
    }
}

Value GetSem(FeatType features) {
    Value sem = features->Get(kSem);
    if (! sem)
        throw std::runtime_error("no " + kSem + " feature in: " + features->ToStr());
    return sem;
}

} // namespace

BindingOperator BindingOperator::FromTerm(TermType term) {
    if (! (term->IsApplication() &&
           term->GetFunction()->IsApplication() &&
           term->GetFunction()->GetFunction()->IsConstant() &&
           term->GetFunction()->GetFunction()->GetName() == kBindingOperator))
        throw CaptureHazard("not a binding operator: " + term->ToStr());
    TermType variable = term->GetArgument();
    if (variable->IsPlaceholder())
        throw CaptureHazard("binding operator over the uninstantiated placeholder "
                + variable->ToStr() + ": " + term->ToStr());
    // a ?v the grammar unified with something other than a variable
    if (! variable->IsVariable())
        throw std::runtime_error("binding operator must bind a variable: " + term->ToStr());
    TermType expr = term->GetFunction()->GetArgument();
    CheckNoPlaceholder(expr, "binding operator");
    return BindingOperator(expr, variable->GetName());
}

TermType BindingOperator::Apply(TermType core) const {
    return Term::App(expr_, Term::Lam(variable_, core));
}

std::string BindingOperator::ToStr() const {
    return kBindingOperator + "(" + expr_->ToStr() + "," + variable_ + ")";
}

TermType GetCore(FeatType features) {
    Value sem = GetSem(features);
    if (sem->IsTerm())
        return sem->GetTerm();
    if (sem->IsStruct()) {
        Value core = sem->AsStruct().Get(kCore);
        if (core && core->IsTerm())
            return core->GetTerm();
    }
    throw std::runtime_error("no semantic core in: " + features->ToStr());
}

std::vector<BindingOperator> GetBindingOperators(FeatType features) {
    std::vector<BindingOperator> res;
    Value sem = GetSem(features);
    if (! sem->IsStruct())
        return res;
    Value bos = sem->AsStruct().Get(kBo);
    if (! bos || ! bos->IsSet())
        return res;
    for (auto&& element: bos->GetElements())
        res.push_back(BindingOperator::FromTerm(element));
    return res;
}

TermType SemanticsComposer::Compose(TermType core,
        const std::vector<BindingOperator>& bos, const std::vector<unsigned>& order) const {
    CheckNoPlaceholder(core, "semantic core");
    TermType res = Reduce(core, max_steps_, order_);
    for (unsigned i: order) {
        if (i >= bos.size())
            throw std::out_of_range("no binding operator " + std::to_string(i));
        res = Reduce(bos[i].Apply(res), max_steps_, order_);
    }
    return res;
}

TermType SemanticsComposer::Reading(EdgeType edge) const {
    std::vector<BindingOperator> bos = GetBindingOperators(edge->GetFeatures());
    std::vector<unsigned> order;
    for (unsigned i = 0; i < bos.size(); i++)
        order.push_back(i);
    return Compose(GetCore(edge->GetFeatures()), bos, order);
}

std::vector<TermType> SemanticsComposer::Readings(EdgeType edge) const {
    TermType core = GetCore(edge->GetFeatures());
    std::vector<BindingOperator> bos = GetBindingOperators(edge->GetFeatures());
    std::vector<unsigned> order;
    for (unsigned i = 0; i < bos.size(); i++)
        order.push_back(i);
    std::vector<TermType> res;
    do {
        res.push_back(Compose(core, bos, order));
    } while (std::next_permutation(order.begin(), order.end()));
    return res;
}

std::vector<TermType> SemanticsComposer::UniqueReadings(const std::vector<TermType>& readings) {
    std::vector<TermType> res;
    for (auto&& reading: readings) {
        bool seen = false;
        for (auto&& other: res) {
            if (AlphaEquivalent(reading, other)) {
                seen = true;
                break;
            }
        }
        if (! seen)
            res.push_back(reading);
    }
    return res;
}

} // namespace semchart
