#include "gridbind/core/Cell.hpp"
#include <cmath>
#include <fmt/format.h>

namespace gridbind {
namespace core {

CellErrorType parseCellErrorType(std::string_view text) {
    if (text == "#NULL!") return CellErrorType::NullValue;
    if (text == "#DIV/0!") return CellErrorType::DivideByZero;
    if (text == "#VALUE!") return CellErrorType::Value;
    if (text == "#REF!") return CellErrorType::Ref;
    if (text == "#NAME?") return CellErrorType::Name;
    if (text == "#NUM!") return CellErrorType::Num;
    if (text == "#N/A") return CellErrorType::NotAvailable;
    if (text == "#ERROR!") return CellErrorType::Error;
    if (text.rfind("#LOADING", 0) == 0) return CellErrorType::Loading;
    return CellErrorType::Unspecified;
}

std::string formatNumber(double value) {
    if (std::isfinite(value) && value == std::floor(value) && std::fabs(value) < 1e15) {
        return fmt::format("{}", static_cast<long long>(value));
    }
    return fmt::format("{}", value);
}

// ========== 工厂方法 ==========

Cell Cell::text(std::string value) {
    CellValue raw;
    raw.string_value = value;
    return Cell(std::move(raw), std::move(value));
}

Cell Cell::number(double value, std::optional<std::string> formatted,
                  std::optional<NumberFormatKind> kind) {
    CellValue raw;
    raw.number_value = value;
    std::optional<std::string> tag;
    if (kind && *kind != NumberFormatKind::Unspecified) {
        tag = toString(*kind);
    }
    if (!formatted) {
        formatted = formatNumber(value);
    }
    return Cell(std::move(raw), std::move(formatted), std::move(tag));
}

Cell Cell::temporal(double serial, std::string formatted, NumberFormatKind kind) {
    return number(serial, std::move(formatted), kind);
}

Cell Cell::boolean(bool value) {
    CellValue raw;
    raw.bool_value = value;
    return Cell(std::move(raw), std::string(value ? "TRUE" : "FALSE"));
}

Cell Cell::error(std::string formatted, std::string message) {
    CellValue raw;
    raw.error_value = CellErrorValue{parseCellErrorType(formatted), std::move(message)};
    return Cell(std::move(raw), std::move(formatted));
}

Cell Cell::formula(std::string formula, std::optional<std::string> formatted) {
    CellValue raw;
    raw.formula_value = std::move(formula);
    return Cell(std::move(raw), std::move(formatted));
}

Cell Cell::unrecognized(std::optional<std::string> formatted) {
    return Cell(CellValue{}, std::move(formatted));
}

// ========== 查询 ==========

NumberFormatKind Cell::getFormatKind() const {
    if (!format_kind_) {
        return NumberFormatKind::Unspecified;
    }
    return parseNumberFormatKind(*format_kind_);
}

namespace {

bool sameRaw(const CellValue& a, const CellValue& b) {
    const bool same_error =
        a.error_value.has_value() == b.error_value.has_value() &&
        (!a.error_value || (a.error_value->type == b.error_value->type &&
                            a.error_value->message == b.error_value->message));
    return a.bool_value == b.bool_value &&
           a.number_value == b.number_value &&
           a.string_value == b.string_value &&
           a.formula_value == b.formula_value &&
           same_error;
}

} // namespace

bool Cell::operator==(const Cell& other) const {
    if (raw_value_.has_value() != other.raw_value_.has_value()) {
        return false;
    }
    if (raw_value_ && !sameRaw(*raw_value_, *other.raw_value_)) {
        return false;
    }
    return formatted_value_ == other.formatted_value_ && format_kind_ == other.format_kind_;
}

}} // namespace gridbind::core
