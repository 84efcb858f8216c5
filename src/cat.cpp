
#include <stdexcept>
#include "cat.h"
#include "utils.h"

namespace semchart {

Cat Category::Parse(const std::string& string) {
    std::string name = utils::trim(string);
    if (! IsCategoryName(name))
        throw std::runtime_error("invalid category name: '" + string + "'");
    Cat res;
#pragma omp critical(category_cache)
    {
        if (Category::Count(name) > 0) {
            res = Category::Get(name);
        } else {
            res = new Category(name);
            res->RegisterCache(name);
        }
    }
    return res;
}

} // namespace semchart
