/**
 * @file ColumnReferenceUtils.cpp
 * @brief 单元格引用与列字母转换工具实现
 */

#include "ColumnReferenceUtils.hpp"
#include <algorithm>
#include <cctype>

namespace gridbind {
namespace utils {

namespace {

bool isAsciiAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

std::optional<uint32_t> ColumnReferenceUtils::parseColumn(std::string_view cell_ref) {
    size_t pos = 0;
    if (pos < cell_ref.size() && cell_ref[pos] == '$') {
        ++pos;
    }

    size_t col_end = pos;
    while (col_end < cell_ref.size() && isAsciiAlpha(cell_ref[col_end])) {
        ++col_end;
    }

    const size_t letters = col_end - pos;
    if (letters == 0 || letters > 3) {
        return std::nullopt;
    }

    uint32_t col = 0;
    for (size_t i = pos; i < col_end; ++i) {
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>(cell_ref[i])));
        col = col * 26 + static_cast<uint32_t>(c - 'A' + 1);
    }

    if (col > MAX_COLUMNS) {
        return std::nullopt;
    }
    return col - 1;
}

std::optional<std::pair<uint32_t, uint32_t>> ColumnReferenceUtils::parseReference(std::string_view reference) {
    auto col = parseColumn(reference);
    if (!col) {
        return std::nullopt;
    }

    // 跳过列部分
    size_t i = 0;
    if (i < reference.size() && reference[i] == '$') ++i;
    while (i < reference.size() && isAsciiAlpha(reference[i])) ++i;
    if (i < reference.size() && reference[i] == '$') ++i;

    if (i >= reference.size()) {
        return std::nullopt;
    }

    uint64_t row = 0;
    for (; i < reference.size(); ++i) {
        if (!isAsciiDigit(reference[i])) {
            return std::nullopt;
        }
        row = row * 10 + static_cast<uint64_t>(reference[i] - '0');
        if (row > UINT32_MAX) {
            return std::nullopt;
        }
    }

    if (row == 0) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<uint32_t>(row - 1), *col);
}

std::string ColumnReferenceUtils::columnToLetters(uint32_t column) {
    std::string result;
    uint64_t col = static_cast<uint64_t>(column) + 1;
    while (col > 0) {
        const uint64_t rem = (col - 1) % 26;
        result.push_back(static_cast<char>('A' + rem));
        col = (col - 1) / 26;
    }
    std::reverse(result.begin(), result.end());
    return result;
}

}} // namespace gridbind::utils
