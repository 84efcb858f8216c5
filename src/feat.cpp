
#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include "feat.h"
#include "utils.h"

namespace semchart {

const std::string kSem  = "SEM";
const std::string kCore = "CORE";
const std::string kBo   = "BO";
const FeaturePath kSemCore = {kSem, kCore};
const FeaturePath kSemBo   = {kSem, kBo};
const std::string kBindingOperator = "bo";

FeaturePath ParsePath(const std::string& path) {
    return utils::Split(path, '.');
}

namespace {

bool IsName(const std::string& name) {
    if (name.empty()) return false;
    for (char c: name) {
        if (! (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '\''))
            return false;
    }
    return true;
}

std::string VariableName(const std::string& string) {
    std::string name = string.substr(1);
    if (! IsName(name))
        throw std::runtime_error("invalid variable name: " + string);
    return name;
}

// the contents of `{...}`: `/`, `<t>`, `?v`, `@x` or nested `{...}`,
// separated by `+` or `,`
void ParseSetItems(const std::string& inner,
        std::vector<TermType>* elements, std::vector<std::string>* pending) {
    for (auto&& part: utils::SplitNonNested(inner, "+")) {
        for (auto&& raw: utils::SplitNonNested(part, ",")) {
            std::string item = utils::trim(raw);
            if (item.empty() || item == "/")
                continue;
            if (item[0] == '{') {
                if (utils::FindClosingBracket(item, 0) != (int)item.size() - 1)
                    throw std::runtime_error("unbalanced set: " + item);
                ParseSetItems(item.substr(1, item.size() - 2), elements, pending);
                continue;
            }
            Value value = FeatureValue::Parse(item);
            if (value->IsVariable())
                pending->push_back(value->GetName());
            else if (value->IsTerm())
                elements->push_back(value->GetTerm());
            else
                throw std::runtime_error("set members must be terms: " + item);
        }
    }
}

std::string CanonicalTerm(TermType term,
        const std::function<std::string(const std::string&)>& rename) {
    return MapMeta(term,
            [&rename] (const Term* meta, TermType* out) -> bool {
                if (meta->GetMetaKind() == ORDINARY)
                    *out = Term::Meta(ORDINARY, rename(meta->GetName()));
                return true;
            })->ToStr();
}

std::string CanonicalStr(Value value, std::unordered_map<std::string, std::string>& names) {
    std::function<std::string(const std::string&)> rename =
            [&names] (const std::string& name) -> std::string {
        auto it = names.find(name);
        if (it != names.end())
            return it->second;
        std::string fresh = "_" + std::to_string(names.size() + 1);
        names.emplace(name, fresh);
        return fresh;
    };
    switch (value->GetType()) {
        case ATOM_VALUE:
            return value->ToStr();
        case VAR_VALUE:
            return "?" + rename(value->GetName());
        case TERM_VALUE:
            return "<" + CanonicalTerm(value->GetTerm(), rename) + ">";
        case SET_VALUE: {
            // order members by their shape: variables already named keep
            // their canonical name, the others all read as ?*
            std::function<std::string(const std::string&)> shape =
                    [&names] (const std::string& name) -> std::string {
                auto it = names.find(name);
                return it != names.end() ? it->second : "*";
            };
            std::vector<std::pair<std::string, TermType>> elements;
            for (auto&& element: value->GetElements())
                elements.emplace_back(CanonicalTerm(element, shape), element);
            std::stable_sort(elements.begin(), elements.end(),
                    [] (const std::pair<std::string, TermType>& e1,
                        const std::pair<std::string, TermType>& e2) {
                        return e1.first < e2.first; });
            std::vector<std::string> items;
            for (auto&& element: elements)
                items.push_back("<" + CanonicalTerm(element.second, rename) + ">");
            std::vector<std::pair<std::string, std::string>> vars;
            for (auto&& var: value->GetPending())
                vars.emplace_back(shape(var), var);
            std::stable_sort(vars.begin(), vars.end(),
                    [] (const std::pair<std::string, std::string>& v1,
                        const std::pair<std::string, std::string>& v2) {
                        return v1.first < v2.first; });
            std::vector<std::string> pending;
            for (auto&& var: vars)
                pending.push_back(var.second);
            for (auto&& var: pending)
                items.push_back("?" + rename(var));
            if (items.empty())
                return "{/}";
            std::stringstream res;
            res << "{";
            for (unsigned i = 0; i < items.size(); i++)
                res << (i > 0 ? ", " : "") << items[i];
            res << "}";
            return res.str();
        }
        case STRUCT_VALUE: {
            std::stringstream res;
            res << "[";
            bool first = true;
            for (auto&& feature: value->AsStruct().GetFeatures()) {
                res << (first ? "" : ", ") << feature.first << "="
                    << CanonicalStr(feature.second, names);
                first = false;
            }
            res << "]";
            return res.str();
        }
    }
    return "";
}

} // namespace

const FeatStruct& FeatureValue::AsStruct() const {
    return dynamic_cast<const FeatStruct&>(*this);
}

Value FeatureValue::Parse(const std::string& string) {
    std::string str = utils::trim(string);
    if (str.empty())
        throw std::runtime_error("missing feature value");
    switch (str[0]) {
        case '?':
            return std::make_shared<const VariableValue>(VariableName(str));
        case '@':
            return std::make_shared<const TermValue>(
                    Term::Meta(PLACEHOLDER, VariableName(str)));
        case '[':
            return FeatStruct::Parse(str);
        case '<':
        case '{': {
            if (utils::FindClosingBracket(str, 0) != (int)str.size() - 1)
                throw std::runtime_error("unbalanced brackets in: " + str);
            std::string inner = str.substr(1, str.size() - 2);
            if (str[0] == '<')
                return std::make_shared<const TermValue>(Term::Parse(inner));
            std::vector<TermType> elements;
            std::vector<std::string> pending;
            ParseSetItems(inner, &elements, &pending);
            return std::make_shared<const SetValue>(elements, pending);
        }
        case '\'':
        case '"':
            if (str.size() < 2 || str.back() != str[0])
                throw std::runtime_error("unterminated quote: " + str);
            return std::make_shared<const AtomValue>(str.substr(1, str.size() - 2));
        default:
            if (! IsName(str) && str != "+" && str != "-")
                throw std::runtime_error("invalid feature value: " + str);
            return std::make_shared<const AtomValue>(str);
    }
}

SetValue::SetValue(const std::vector<TermType>& elements,
                   const std::vector<std::string>& pending) {
    for (auto&& element: elements) {
        if (! Contains(element))
            elements_.push_back(element);
    }
    for (auto&& var: pending) {
        if (std::find(pending_.begin(), pending_.end(), var) == pending_.end())
            pending_.push_back(var);
    }
}

bool SetValue::Contains(TermType term) const {
    for (auto&& element: elements_) {
        if (element->Equals(term.get()))
            return true;
    }
    return false;
}

std::string SetValue::ToStr() const {
    if (elements_.empty() && pending_.empty())
        return "{/}";
    std::stringstream res;
    res << "{";
    bool first = true;
    for (auto&& element: elements_) {
        res << (first ? "" : ", ") << "<" << element->ToStr() << ">";
        first = false;
    }
    for (auto&& var: pending_) {
        res << (first ? "" : ", ") << "?" << var;
        first = false;
    }
    res << "}";
    return res.str();
}

// order of elements does not matter
bool SetValue::Equals(const FeatureValue* other) const {
    if (! other->IsSet() ||
            other->GetElements().size() != elements_.size() ||
            other->GetPending().size() != pending_.size())
        return false;
    const SetValue& o = static_cast<const SetValue&>(*other);
    for (auto&& element: elements_) {
        if (! o.Contains(element))
            return false;
    }
    for (auto&& var: pending_) {
        if (std::find(o.pending_.begin(), o.pending_.end(), var) == o.pending_.end())
            return false;
    }
    return true;
}

FeatType FeatStruct::Parse(const std::string& string) {
    std::string str = utils::trim(string);
    if (str.empty())
        return std::make_shared<const FeatStruct>();
    if (str[0] != '[' || utils::FindClosingBracket(str, 0) != (int)str.size() - 1)
        throw std::runtime_error("unbalanced feature structure: " + str);
    Features features;
    std::string inner = utils::trim(str.substr(1, str.size() - 2));
    if (inner.empty())
        return std::make_shared<const FeatStruct>();
    for (auto&& raw: utils::SplitNonNested(inner, ",")) {
        std::string item = utils::trim(raw);
        std::string name;
        Value value;
        if (! item.empty() && (item[0] == '+' || item[0] == '-')) {
            name = utils::trim(item.substr(1));
            value = std::make_shared<const AtomValue>(item.substr(0, 1));
        } else {
            int eq = utils::FindNonNested(item, "=");
            if (eq < 1)
                throw std::runtime_error("feature assignment expected: " + item);
            name = utils::trim(item.substr(0, eq));
            value = FeatureValue::Parse(item.substr(eq + 1));
        }
        if (! IsName(name))
            throw std::runtime_error("invalid feature name: " + item);
        if (features.count(name) > 0)
            throw std::runtime_error("duplicate feature " + name + " in: " + str);
        features.emplace(name, value);
    }
    return std::make_shared<const FeatStruct>(features);
}

std::string FeatStruct::ToStr() const {
    std::stringstream res;
    res << "[";
    bool first = true;
    for (auto&& feature: features_) {
        res << (first ? "" : ", ") << feature.first << "=" << feature.second->ToStr();
        first = false;
    }
    res << "]";
    return res.str();
}

bool FeatStruct::Equals(const FeatureValue* other) const {
    if (! other->IsStruct())
        return false;
    const Features& others = other->AsStruct().GetFeatures();
    if (others.size() != features_.size())
        return false;
    for (auto&& feature: features_) {
        auto it = others.find(feature.first);
        if (it == others.end() || ! feature.second->Equals(it->second.get()))
            return false;
    }
    return true;
}

Value FeatStruct::Get(const std::string& name) const {
    auto it = features_.find(name);
    return it == features_.end() ? nullptr : it->second;
}

Value FeatStruct::Get(const FeaturePath& path) const {
    const FeatStruct* current = this;
    Value res;
    for (unsigned i = 0; i < path.size(); i++) {
        res = current->Get(path[i]);
        if (! res)
            return nullptr;
        if (i + 1 < path.size()) {
            if (! res->IsStruct())
                return nullptr;
            current = &res->AsStruct();
        }
    }
    return res;
}

std::string Canonical(Value value) {
    std::unordered_map<std::string, std::string> names;
    return CanonicalStr(value, names);
}

} // namespace semchart
