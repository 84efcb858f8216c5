#include "chart.h"

namespace semchart {

std::string EdgeKey(Cat cat, FeatType features) {
    return cat->ToStr() + Canonical(features);
}

bool ChartCell::update(EdgeType edge, const std::string& key) {
    if (! keys.insert(key).second)
        return false;
    items.emplace(edge->GetCategory(), edge);
    ordered.push_back(edge);
    return true;
}

Chart::Chart(int sent_size)
    : sent_size_(sent_size),
      num_edges_(0),
      cells_(sent_size * sent_size, nullptr) {}

Chart::~Chart() {
    for (ChartCell* cell: cells_)
        delete cell;
}

ChartCell* Chart::operator() (int start, int length) {
    ChartCell*& cell = cells_[start * sent_size_ + length];
    if (! cell)
        cell = new ChartCell();
    return cell;
}

bool Chart::Insert(ChartCell* cell, EdgeType edge, const std::string& key) {
    if (! cell->update(edge, key))
        return false;
    num_edges_++;
    return true;
}

std::vector<EdgeType> Chart::Spanning(Cat cat) const {
    std::vector<EdgeType> res;
    const ChartCell* top = sent_size_ > 0 ? Get(0, sent_size_ - 1) : nullptr;
    if (! top)
        return res;
    for (auto&& edge: top->ordered) {
        if (edge->GetCategory() == cat)
            res.push_back(edge);
    }
    return res;
}

} // namespace semchart
