#include "gridbind/core/Grid.hpp"
#include <algorithm>

namespace gridbind {
namespace core {

bool isRowEmpty(const Row& row) {
    return std::all_of(row.begin(), row.end(),
                       [](const Cell& cell) { return cell.isAbsent(); });
}

size_t Grid::columnCount() const {
    size_t count = 0;
    for (const auto& r : rows_) {
        count = std::max(count, r.size());
    }
    return count;
}

}} // namespace gridbind::core
