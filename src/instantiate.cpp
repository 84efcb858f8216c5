
#include <algorithm>
#include <map>
#include <set>
#include "instantiate.h"
#include "errors.h"

namespace semchart {

namespace {

void CollectTerms(Value value, std::vector<TermType>* out) {
    switch (value->GetType()) {
        case TERM_VALUE:
            out->push_back(value->GetTerm());
            break;
        case SET_VALUE:
            out->insert(out->end(),
                    value->GetElements().begin(), value->GetElements().end());
            break;
        case STRUCT_VALUE:
            for (auto&& feature: value->AsStruct().GetFeatures())
                CollectTerms(feature.second, out);
            break;
        default:
            break;
    }
}

TermType Replace(TermType term, const std::map<std::string, std::string>& fresh) {
    return MapMeta(term,
            [&fresh] (const Term* meta, TermType* out) -> bool {
                if (meta->GetMetaKind() == PLACEHOLDER)
                    *out = Term::Var(fresh.at(meta->GetName()));
                return true;
            });
}

Value Replace(Value value, const std::map<std::string, std::string>& fresh) {
    switch (value->GetType()) {
        case TERM_VALUE:
            return std::make_shared<const TermValue>(Replace(value->GetTerm(), fresh));
        case SET_VALUE: {
            std::vector<TermType> elements;
            for (auto&& element: value->GetElements())
                elements.push_back(Replace(element, fresh));
            return std::make_shared<const SetValue>(elements, value->GetPending());
        }
        case STRUCT_VALUE: {
            FeatStruct::Features features;
            for (auto&& feature: value->AsStruct().GetFeatures())
                features.emplace(feature.first, Replace(feature.second, fresh));
            return std::make_shared<const FeatStruct>(features);
        }
        default:
            return value;
    }
}

} // namespace

unsigned NextFreshId() {
    static unsigned counter = 0;
    unsigned res;
#pragma omp atomic capture
    res = ++counter;
    return res;
}

std::vector<std::string> Placeholders(Value value) {
    std::vector<TermType> terms;
    CollectTerms(value, &terms);
    std::vector<std::string> res;
    for (auto&& term: terms) {
        std::vector<const Term*> metas;
        CollectMeta(term, &metas);
        for (const Term* meta: metas) {
            if (meta->GetMetaKind() == PLACEHOLDER &&
                    std::find(res.begin(), res.end(), meta->GetName()) == res.end())
                res.push_back(meta->GetName());
        }
    }
    return res;
}

FeatType InstantiatePlaceholders(FeatType fs) {
    std::vector<std::string> placeholders = Placeholders(fs);
    if (placeholders.empty())
        return fs;
    std::vector<TermType> terms;
    CollectTerms(fs, &terms);
    std::set<std::string> used;
    for (auto&& term: terms) {
        std::set<std::string> names = Names(term);
        used.insert(names.begin(), names.end());
    }
    std::map<std::string, std::string> fresh;
    for (auto&& placeholder: placeholders) {
        std::string name = placeholder + std::to_string(NextFreshId());
        if (used.count(name) > 0)
            throw CaptureHazard("fresh variable " + name +
                    " already occurs in " + fs->ToStr());
        fresh.emplace(placeholder, name);
    }
    return std::static_pointer_cast<const FeatStruct>(Replace(fs, fresh));
}

} // namespace semchart
