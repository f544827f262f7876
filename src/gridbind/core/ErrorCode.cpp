#include "gridbind/core/ErrorCode.hpp"
#include "gridbind/utils/ColumnReferenceUtils.hpp"

namespace gridbind {
namespace core {

// Error类构造函数实现
Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

std::string CellPosition::toReference() const {
    return utils::ColumnReferenceUtils::cellReference(row, column);
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        case ErrorCode::ZeroRows:
            return "zero rows in sheet";

        case ErrorCode::MissingValue:
            return "expected value but it wasn't present";
        case ErrorCode::NotNumber:
            return "expected number value";
        case ErrorCode::NotBoolean:
            return "expected bool value";

        case ErrorCode::UnsupportedVariant:
            return "enum variants with associated data are not supported";
        case ErrorCode::Custom:
            return "custom decode error";

        case ErrorCode::UpstreamFailure:
            return "grid source failed";

        default:
            return "Unknown error";
    }
}

Error makeCellError(ErrorCode code, CellPosition position) {
    Error error(code);
    error.context = fmt::format("at {} (row {}, column {})",
                                position.toReference(), position.row + 1, position.column + 1);
    error.position = position;
    return error;
}

}} // namespace gridbind::core
