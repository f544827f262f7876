/**
 * @file GridWorksheetParser.cpp
 * @brief 工作表XML流式解析器实现
 */

#include "gridbind/reader/GridWorksheetParser.hpp"
#include "gridbind/reader/SharedStringsParser.hpp"
#include "gridbind/reader/StylesParser.hpp"
#include "gridbind/utils/ColumnReferenceUtils.hpp"
#include "gridbind/utils/TimeUtils.hpp"
#include <cmath>

namespace gridbind {
namespace reader {

void GridWorksheetParser::configure(const SharedStringsParser* shared_strings,
                                    const StylesParser* styles,
                                    bool date1904,
                                    std::optional<size_t> max_rows) {
    shared_strings_ = shared_strings;
    styles_ = styles;
    date1904_ = date1904;
    max_rows_ = max_rows;
}

void GridWorksheetParser::reset() {
    rows_.clear();
    cells_processed_ = 0;
    in_sheet_data_ = false;
    in_row_ = false;
    in_cell_ = false;
    in_inline_string_ = false;
    in_phonetic_ = false;
    current_row_ = 0;
    next_row_ = 0;
    current_col_ = 0;
    next_col_ = 0;
}

core::Grid GridWorksheetParser::takeGrid() {
    while (!rows_.empty() && core::isRowEmpty(rows_.back())) {
        rows_.pop_back();
    }
    core::Grid grid(std::move(rows_));
    rows_.clear();
    return grid;
}

void GridWorksheetParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "sheetData") {
        in_sheet_data_ = true;
    } else if (name == "row" && in_sheet_data_) {
        in_row_ = true;
        // 行号缺省时紧接上一行
        auto r = findIntAttribute(attributes, "r");
        current_row_ = (r && *r > 0) ? static_cast<uint32_t>(*r - 1) : next_row_;
        next_row_ = current_row_ + 1;
        next_col_ = 0;
    } else if (name == "c" && in_row_) {
        beginCell(attributes);
    } else if (!in_cell_) {
        return;
    } else if (name == "v" || name == "f") {
        startCollectingText();
    } else if (name == "is") {
        in_inline_string_ = true;
    } else if (name == "rPh") {
        in_phonetic_ = true;
    } else if (name == "t" && in_inline_string_ && !in_phonetic_) {
        startCollectingText();
    }
}

void GridWorksheetParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "sheetData") {
        in_sheet_data_ = false;
        READER_DEBUG("Worksheet parsed: {} rows, {} cells", rows_.size(), cells_processed_);
    } else if (name == "row") {
        in_row_ = false;
    } else if (name == "c") {
        if (in_cell_) {
            finishCell();
        }
    } else if (!in_cell_) {
        return;
    } else if (name == "v") {
        cell_value_ = getCurrentText();
        stopCollectingText();
    } else if (name == "f") {
        // 共享公式的从属单元格只有 <f t="shared" si="0"/>，没有文本
        if (!getCurrentText().empty()) {
            cell_formula_ = getCurrentText();
        }
        stopCollectingText();
    } else if (name == "t" && in_inline_string_) {
        if (state_.collecting_text) {
            inline_text_ += getCurrentText();
            stopCollectingText();
        }
    } else if (name == "rPh") {
        in_phonetic_ = false;
    } else if (name == "is") {
        in_inline_string_ = false;
    }
}

void GridWorksheetParser::beginCell(const std::vector<xml::XMLAttribute>& attributes) {
    in_cell_ = true;
    cell_type_ = getAttributeOr(attributes, "t", "n");
    cell_style_ = 0;
    if (auto s = findIntAttribute(attributes, "s"); s && *s >= 0) {
        cell_style_ = static_cast<size_t>(*s);
    }
    cell_value_.reset();
    cell_formula_.reset();
    inline_text_.clear();

    current_col_ = next_col_;
    if (auto ref = findAttribute(attributes, "r")) {
        if (auto col = utils::ColumnReferenceUtils::parseColumn(*ref)) {
            current_col_ = *col;
        } else {
            READER_WARN("Invalid cell reference '{}' in row {}", *ref, current_row_ + 1);
        }
    }
    next_col_ = current_col_ + 1;
}

void GridWorksheetParser::finishCell() {
    in_cell_ = false;
    in_inline_string_ = false;
    in_phonetic_ = false;

    if (max_rows_ && current_row_ >= *max_rows_) {
        return;
    }

    auto cell = buildCell();
    if (cell) {
        storeCell(std::move(*cell));
    }
}

std::optional<core::Cell> GridWorksheetParser::buildCell() {
    if (cell_type_ == "inlineStr") {
        return core::Cell::text(inline_text_);
    }

    if (!cell_value_) {
        if (cell_formula_) {
            return core::Cell::formula(*cell_formula_, "=" + *cell_formula_);
        }
        return std::nullopt;
    }

    const std::string& value = *cell_value_;

    if (cell_type_ == "s") {
        auto index = parseInt(value);
        const std::string* text = (index && *index >= 0 && shared_strings_)
            ? shared_strings_->getString(static_cast<size_t>(*index)) : nullptr;
        if (!text) {
            setError(fmt::format("Invalid shared string index '{}' at {}", value,
                                 utils::ColumnReferenceUtils::cellReference(current_row_, current_col_)));
            return std::nullopt;
        }
        return core::Cell::text(*text);
    }
    if (cell_type_ == "str" || cell_type_ == "d") {
        return core::Cell::text(value);
    }
    if (cell_type_ == "b") {
        return core::Cell::boolean(value == "1" || value == "true");
    }
    if (cell_type_ == "e") {
        return core::Cell::error(value);
    }

    auto number = parseDouble(value);
    if (!number) {
        setError(fmt::format("Invalid numeric value '{}' at {}", value,
                             utils::ColumnReferenceUtils::cellReference(current_row_, current_col_)));
        return std::nullopt;
    }

    std::optional<core::NumberFormatKind> kind;
    if (styles_) {
        kind = styles_->getFormatKind(cell_style_);
    }
    return core::Cell::number(*number, renderNumber(*number, kind, date1904_), kind);
}

void GridWorksheetParser::storeCell(core::Cell cell) {
    if (rows_.size() <= current_row_) {
        rows_.resize(static_cast<size_t>(current_row_) + 1);
    }
    core::Row& row = rows_[current_row_];
    if (row.size() <= current_col_) {
        row.resize(static_cast<size_t>(current_col_) + 1);
    }
    row[current_col_] = std::move(cell);
    cells_processed_++;
}

std::string GridWorksheetParser::renderNumber(double value, std::optional<core::NumberFormatKind> kind, bool date1904) {
    if (!kind) {
        return core::formatNumber(value);
    }

    switch (*kind) {
        case core::NumberFormatKind::Date:
        case core::NumberFormatKind::Time:
        case core::NumberFormatKind::DateTime: {
            auto dt = utils::TimeUtils::fromExcelSerial(value, date1904);
            if (!dt) {
                return core::formatNumber(value);
            }
            if (*kind == core::NumberFormatKind::Date) return utils::TimeUtils::formatDate(*dt);
            if (*kind == core::NumberFormatKind::Time) return utils::TimeUtils::formatTime(*dt);
            return utils::TimeUtils::formatDateTime(*dt);
        }
        case core::NumberFormatKind::Percent: {
            // 去掉乘法带来的二进制误差（0.07 * 100 = 7.000000000000001）
            const double percent = std::round(value * 100.0 * 1e9) / 1e9;
            return core::formatNumber(percent) + "%";
        }
        default:
            return core::formatNumber(value);
    }
}

}} // namespace gridbind::reader
