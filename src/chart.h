
#ifndef INCLUDE_SEMCHART_CHART_H_
#define INCLUDE_SEMCHART_CHART_H_

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "tree.h"

namespace semchart {

// the edges over one span, indexed by category. two edges are the same when
// their categories and canonical feature structures coincide.
struct ChartCell
{
    typedef std::unordered_multimap<Cat, EdgeType>::const_iterator iterator;

    bool Contains(const std::string& key) const { return keys.count(key) > 0; }

    // false when an edge with the same key is already here
    bool update(EdgeType edge, const std::string& key);

    std::pair<iterator, iterator> EdgesOf(Cat cat) const { return items.equal_range(cat); }

    std::unordered_multimap<Cat, EdgeType> items;
    // insertion order; the unary closure walks it as an agenda
    std::vector<EdgeType> ordered;
    std::unordered_set<std::string> keys;
};

// key under which `features` of category `cat` is deduplicated
std::string EdgeKey(Cat cat, FeatType features);


// cells are addressed by (start, length - 1)
class Chart
{
public:
    Chart(int sent_size);

    ~Chart();

    // created on first access
    ChartCell* operator() (int start, int length);

    // nullptr when nothing has been added over that span
    const ChartCell* Get(int start, int length) const {
        return cells_[start * sent_size_ + length];
    }

    // adds `edge` to `cell` unless an equal edge is there already
    bool Insert(ChartCell* cell, EdgeType edge, const std::string& key);

    // edges of category `cat` covering the whole sentence
    std::vector<EdgeType> Spanning(Cat cat) const;

    unsigned NumEdges() const { return num_edges_; }

private:
    Chart(const Chart&);
    Chart& operator=(const Chart&);

    int sent_size_;
    unsigned num_edges_;
    std::vector<ChartCell*> cells_;
};

} // namespace semchart

#endif
