
#ifndef INCLUDE_SEMCHART_TREE_H_
#define INCLUDE_SEMCHART_TREE_H_

#include <memory>
#include <sstream>
#include <vector>
#include "cat.h"
#include "feat.h"
#include "grammar.h"


namespace semchart {

class Edge;
class Leaf;
class Tree;
typedef std::shared_ptr<const Edge> EdgeType;

class FormatVisitor {
public:
    virtual ~FormatVisitor() {}
    virtual int Visit(const Leaf* leaf) = 0;
    virtual int Visit(const Tree* tree) = 0;
};

// a completed constituent over the tokens [start, end). edges never change
// once they are in the chart.
class Edge
{
public:
    Edge(Cat cat, FeatType features, RuleType rule, int start, int end)
    : cat_(cat), features_(features), rule_(rule), start_(start), end_(end) {}

    virtual ~Edge() {}

    Cat GetCategory() const { return cat_; }
    FeatType GetFeatures() const { return features_; }
    RuleType GetRule() const { return rule_; }
    int GetStart() const { return start_; }
    int GetEnd() const { return end_; }
    int Length() const { return end_ - start_; }

    // (S (NP (Det a) (N dog)) (VP (IV barks)))
    std::string ToStr() const;

    virtual bool IsLeaf() const = 0;
    virtual int NumDescendants() const = 0;
    virtual int Accept(FormatVisitor& visitor) const = 0;

    friend std::ostream& operator<<(std::ostream& ost, const Edge* edge) {
        ost << edge->ToStr();
        return ost;
    }

protected:
    Cat cat_;
    FeatType features_;
    RuleType rule_;
    int start_;
    int end_;
};

// built by a terminal rule
class Leaf: public Edge
{
public:
    Leaf(const std::string& word, Cat cat, FeatType features, RuleType rule, int position)
    : Edge(cat, features, rule, position, position + 1), word_(word) {}

    const std::string& GetWord() const { return word_; }
    int GetPosition() const { return start_; }
    bool IsLeaf() const { return true; }
    int NumDescendants() const { return 0; }
    int Accept(FormatVisitor& visitor) const { return visitor.Visit(this); }

private:
    std::string word_;
};

class Tree: public Edge
{
public:
    Tree(Cat cat, FeatType features, RuleType rule, const std::vector<EdgeType>& children)
    : Edge(cat, features, rule,
           children.front()->GetStart(), children.back()->GetEnd()),
      children_(children) {}

    const std::vector<EdgeType>& GetChildren() const { return children_; }
    bool IsUnary() const { return children_.size() == 1; }
    bool IsLeaf() const { return false; }
    int NumDescendants() const {
        int res = 0;
        for (auto&& child: children_)
            res += child->NumDescendants() + 1;
        return res;
    }
    int Accept(FormatVisitor& visitor) const { return visitor.Visit(this); }

private:
    std::vector<EdgeType> children_;
};


class GetLeaves: public FormatVisitor {
    typedef std::vector<const Leaf*> result_type;

public:
    GetLeaves() {}
    result_type operator()(const Edge* edge) {
        edge->Accept(*this);
        return leaves_;
    }

    int Visit(const Tree* tree) {
        for (auto&& child: tree->GetChildren())
            child->Accept(*this);
        return 0;
    }

    int Visit(const Leaf* leaf) {
        leaves_.push_back(leaf);
        return 0;
    }

result_type leaves_;
};

// categories over the words, then a dashed line under each rule application
// with the resulting category centred below it
class Derivation: public FormatVisitor {

public:
    Derivation(const Edge* edge, bool feat=false)
        : edge_(edge), lwidth_(0), feat_(feat) { Process(); }
    Derivation(EdgeType edge, bool feat=false)
        : edge_(edge.get()), lwidth_(0), feat_(feat) { Process(); }

    void Process();
    std::string Get() const { return out_.str(); }
    friend std::ostream& operator<<(std::ostream& ost, const Derivation& deriv) {
        ost << deriv.out_.str();
        return ost;
    }
    int Visit(const Tree* tree);
    int Visit(const Leaf* leaf);

private:
    std::string Label(const Edge* edge) const;

    const Edge* edge_;
    std::stringstream out_;
    int lwidth_;
    bool feat_;
};

class Bracketed: public FormatVisitor {
public:
    Bracketed(const Edge* edge): edge_(edge) { Process(); }
    Bracketed(EdgeType edge): edge_(edge.get()) { Process(); }

    void Process() { edge_->Accept(*this); }
    std::string Get() const { return out_.str(); }

    int Visit(const Tree* tree) {
        out_ << "(" << tree->GetCategory();
        for (auto&& child: tree->GetChildren()) {
            out_ << " ";
            child->Accept(*this);
        }
        out_ << ")";
        return 0;
    }

    int Visit(const Leaf* leaf) {
        out_ << "(" << leaf->GetCategory() << " " << leaf->GetWord() << ")";
        return 0;
    }

private:
    const Edge* edge_;
    std::stringstream out_;
};

} // namespace semchart

#endif
