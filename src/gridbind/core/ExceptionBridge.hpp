/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接底层Result/Expected和用户层Exception
 */

#pragma once

#include "Expected.hpp"
#include "ErrorCode.hpp"
#include "Exception.hpp"
#include <utility>

namespace gridbind {
namespace core {

/**
 * @brief 异常转换层
 *
 * 1. 解码引擎、协议与数据源使用 Expected/Result
 * 2. 用户层 *OrThrow 接口使用异常
 * 3. 两者之间在这里统一转换
 */
class ExceptionBridge {
public:
    /**
     * @brief 将Result转换为异常抛出
     * @throws GridBindException 如果result包含错误
     */
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return std::move(result).value();
    }

    template<typename T>
    static T unwrap(const Result<T>& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return result.value();
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
    }

    /**
     * @brief 从ErrorCode映射到异常类型并抛出
     */
    [[noreturn]] static void throwFromError(const Error& error) {
        switch (error.code) {
            case ErrorCode::MissingValue:
            case ErrorCode::NotNumber:
            case ErrorCode::NotBoolean:
                if (error.position) {
                    throw DecodeException(error.fullMessage(), error.code,
                                          static_cast<int>(error.position->row),
                                          static_cast<int>(error.position->column));
                }
                throw DecodeException(error.fullMessage(), error.code);

            case ErrorCode::ZeroRows:
            case ErrorCode::UnsupportedVariant:
                throw DecodeException(error.fullMessage(), error.code);

            case ErrorCode::UpstreamFailure:
                throw UpstreamException(error.message, error.context);

            default:
                throw GridBindException(error.fullMessage(), error.code);
        }
    }
};

}} // namespace gridbind::core

// 在用户层API中使用，自动转换Result为异常
#define GRIDBIND_UNWRAP(result) \
    gridbind::core::ExceptionBridge::unwrap(result)
