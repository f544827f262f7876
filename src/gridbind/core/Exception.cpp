/**
 * @file Exception.cpp
 * @brief GridBind异常类实现
 */

#include "Exception.hpp"
#include "gridbind/utils/ColumnReferenceUtils.hpp"
#include <fmt/format.h>

namespace gridbind {
namespace core {

// GridBindException 实现
GridBindException::GridBindException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string GridBindException::getErrorCodeString() const {
    switch (error_code_) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::ZeroRows: return "ZeroRows";
        case ErrorCode::MissingValue: return "MissingValue";
        case ErrorCode::NotNumber: return "NotNumber";
        case ErrorCode::NotBoolean: return "NotBoolean";
        case ErrorCode::UnsupportedVariant: return "UnsupportedVariant";
        case ErrorCode::Custom: return "Custom";
        case ErrorCode::UpstreamFailure: return "UpstreamFailure";
        default: return "Unknown";
    }
}

std::string GridBindException::getDetailedMessage() const {
    std::string detailed = fmt::format("[{}] {}", getErrorCodeString(), what());

    if (file_ && line_ > 0) {
        detailed += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        detailed += "\nContext:";
        for (const auto& ctx : context_) {
            detailed += fmt::format("\n  - {}", ctx);
        }
    }

    return detailed;
}

void GridBindException::addContext(const std::string& context) {
    context_.push_back(context);
}

// DecodeException 实现
DecodeException::DecodeException(const std::string& message,
                                 ErrorCode code,
                                 int row, int col,
                                 const char* file, int line)
    : GridBindException(message, code, file, line)
    , row_(row)
    , col_(col) {
}

std::string DecodeException::getCellReference() const {
    if (!hasPosition()) {
        return "Unknown";
    }
    return utils::ColumnReferenceUtils::cellReference(static_cast<uint32_t>(row_),
                                                      static_cast<uint32_t>(col_));
}

// UpstreamException 实现
UpstreamException::UpstreamException(const std::string& message,
                                     const std::string& source,
                                     const char* file, int line)
    : GridBindException(message, ErrorCode::UpstreamFailure, file, line)
    , source_(source) {
}

}} // namespace gridbind::core
