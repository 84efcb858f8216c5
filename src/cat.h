
#ifndef INCLUDE_SEMCHART_CAT_H_
#define INCLUDE_SEMCHART_CAT_H_

#include <cctype>
#include <functional>
#include <ostream>
#include <string>
#include <vector>
#include "cacheable.h"

namespace semchart {

class Category;

typedef const Category* Cat;

// a syntactic category symbol such as S, NP or TV. categories are interned:
// one instance per name, compared by id.
class Category: public Cacheable<Category>
{
public:
    // returns the interned instance, creating it on first use
    static Cat Parse(const std::string& name);

    const std::string& ToStr() const { return name_; }

    friend std::ostream& operator<<(std::ostream& ost, Cat cat) {
        ost << cat->name_;
        return ost;
    }

private:
    Category(const std::string& name): name_(name) {}

    std::string name_;
};

inline bool IsCategoryName(const std::string& name) {
    if (name.empty()) return false;
    for (char c: name) {
        if (! (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '\''))
            return false;
    }
    return true;
}

} // namespace semchart

namespace std {

template<>
struct equal_to<semchart::Cat>
{
    inline bool operator () (semchart::Cat c1, semchart::Cat c2) const {
        return c1->GetId() == c2->GetId();
    }
};

template<>
struct hash<semchart::Cat>
{
    inline size_t operator () (semchart::Cat c) const {
        return c->GetId();
    }
};

} // namespace std

#endif
