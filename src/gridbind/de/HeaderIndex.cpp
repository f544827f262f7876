#include "gridbind/de/HeaderIndex.hpp"
#include <algorithm>

namespace gridbind {
namespace de {

HeaderIndex HeaderIndex::fromRow(const core::Row& header) {
    HeaderIndex index;
    index.names_.reserve(header.size());
    for (const auto& cell : header) {
        const auto& text = cell.getFormattedValue();
        if (text) {
            index.names_.emplace_back(std::string_view(*text));
        } else {
            index.names_.emplace_back(std::nullopt);
        }
    }
    return index;
}

std::optional<std::string_view> HeaderIndex::fieldName(size_t column) const {
    if (column >= names_.size()) {
        return std::nullopt;
    }
    return names_[column];
}

std::optional<size_t> HeaderIndex::nextFieldColumn(size_t from, size_t limit) const {
    const size_t end = std::min(limit, names_.size());
    for (size_t col = from; col < end; ++col) {
        if (names_[col]) {
            return col;
        }
    }
    return std::nullopt;
}

std::optional<size_t> HeaderIndex::columnOf(std::string_view name) const {
    for (size_t col = 0; col < names_.size(); ++col) {
        if (names_[col] && *names_[col] == name) {
            return col;
        }
    }
    return std::nullopt;
}

size_t HeaderIndex::fieldCount() const {
    return static_cast<size_t>(std::count_if(names_.begin(), names_.end(),
        [](const std::optional<std::string_view>& n) { return n.has_value(); }));
}

}} // namespace gridbind::de
