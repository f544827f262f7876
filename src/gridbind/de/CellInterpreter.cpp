#include "gridbind/de/CellInterpreter.hpp"

namespace gridbind {
namespace de {

const char* toString(ScalarKind kind) noexcept {
    switch (kind) {
        case ScalarKind::Missing: return "missing";
        case ScalarKind::Boolean: return "boolean";
        case ScalarKind::Number:  return "number";
        case ScalarKind::Text:    return "text";
        default:                  return "unknown";
    }
}

bool CellInterpreter::isTemporalTag(std::string_view tag) {
    return tag == "DATE" || tag == "TIME" || tag == "DATE_TIME";
}

InterpretedScalar CellInterpreter::displayText(const core::Cell& cell) {
    InterpretedScalar result;
    const auto& text = cell.getFormattedValue();
    if (text) {
        result.kind = ScalarKind::Text;
        result.text = *text;
    }
    return result;
}

InterpretedScalar CellInterpreter::interpret(const core::Cell& cell) {
    InterpretedScalar result;
    const auto& raw = cell.getRawValue();
    if (!raw) {
        return result;
    }

    if (raw->bool_value) {
        result.kind = ScalarKind::Boolean;
        result.boolean = *raw->bool_value;
        return result;
    }

    // 错误和公式都以显示文本呈现
    if (raw->error_value || raw->formula_value) {
        return displayText(cell);
    }

    if (raw->number_value) {
        const auto& tag = cell.getFormatKindTag();
        if (tag && isTemporalTag(*tag)) {
            return displayText(cell);
        }
        result.kind = ScalarKind::Number;
        result.number = *raw->number_value;
        return result;
    }

    if (raw->string_value) {
        result.kind = ScalarKind::Text;
        result.text = *raw->string_value;
        return result;
    }

    return result;
}

}} // namespace gridbind::de
