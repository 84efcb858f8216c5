#include <algorithm>
#include "tree.h"
#include "utils.h"

#define REPEAT(out, size, string) for (int __sp__ = 0; __sp__ < (size); __sp__++) \
                                                    (out) << (string)
#define SPACE(out, size) REPEAT(out, size, " ")

namespace semchart {

std::string Edge::ToStr() const {
    Bracketed res(this);
    return res.Get();
}

std::string Derivation::Label(const Edge* edge) const {
    std::string res = edge->GetCategory()->ToStr();
    if (feat_)
        res += edge->GetFeatures()->ToStr();
    return res;
}

int Derivation::Visit(const Leaf* leaf) {
    return std::max(std::max(
                lwidth_, 2 + lwidth_ + (int)utils::utf8_strlen(Label(leaf))),
                2 + lwidth_ + (int)utils::utf8_strlen(leaf->GetWord()));
}

int Derivation::Visit(const Tree* tree) {
    int lwidth = lwidth_;
    int rwidth = lwidth;
    for (auto&& child: tree->GetChildren()) {
        lwidth_ = rwidth;
        rwidth = std::max(rwidth, child->Accept(*this));
    }

    std::string str_res = Label(tree);
    int respadlen = (rwidth - lwidth - (int)utils::utf8_strlen(str_res)) / 2 + lwidth;

    SPACE(out_, lwidth);
    REPEAT(out_, (rwidth - lwidth), "-");
    out_ << std::endl;
    SPACE(out_, respadlen);
    out_ << str_res << std::endl;
    return rwidth;
}

void Derivation::Process() {
    std::stringstream cats;
    std::stringstream words;
    std::vector<const Leaf*> leaves = GetLeaves()(edge_);
    for (unsigned i = 0; i < leaves.size(); i++) {
        std::string str_cat = Label(leaves[i]);
        std::string str_word = leaves[i]->GetWord();
        int catlen = utils::utf8_strlen(str_cat);
        int wordlen = utils::utf8_strlen(str_word);
        int nextlen = 2 + std::max(catlen, wordlen);
        int lcatlen = (nextlen - catlen) / 2;
        int rcatlen = lcatlen + (nextlen - catlen) % 2;
        int lwordlen = (nextlen - wordlen) / 2;
        int rwordlen = lwordlen + (nextlen - wordlen) % 2;
        SPACE(cats, lcatlen);
        cats << str_cat;
        SPACE(cats, rcatlen);
        SPACE(words, lwordlen);
        words << str_word;
        SPACE(words, rwordlen);
    }

    out_ << cats.str() << std::endl;
    out_ << words.str() << std::endl;
    lwidth_ = 0;
    edge_->Accept(*this);
}

} // namespace semchart
