#pragma once

#include "gridbind/core/ErrorCode.hpp"
#include <type_traits>
#include <utility>
#include <new>

namespace gridbind {
namespace core {

/**
 * @brief Expected<T, E> - 解码路径上的错误处理类型
 *
 * 类似于std::expected (C++23)：
 * - 解码热路径无异常开销
 * - 移动语义：大对象（Grid、解码结果）只移动不拷贝
 * - 链式操作：map / andThen
 */
template<typename T, typename E = Error>
class Expected {
private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;

public:
    using value_type = T;
    using error_type = E;

    // ========== 构造函数 ==========

    /**
     * @brief 成功值构造函数
     */
    Expected(const T& value) : has_value_(true) {
        new(&value_) T(value);
    }

    Expected(T&& value) : has_value_(true) {
        new(&value_) T(std::move(value));
    }

    /**
     * @brief 错误构造函数
     */
    Expected(const E& error) : has_value_(false) {
        new(&error_) E(error);
    }

    Expected(E&& error) : has_value_(false) {
        new(&error_) E(std::move(error));
    }

    Expected(const Expected& other) : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(other.value_);
        } else {
            new(&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new(&value_) T(std::move(other.value_));
        } else {
            new(&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    // ========== 赋值操作符 ==========

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            this->~Expected();
            new(this) Expected(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            new(this) Expected(std::move(other));
        }
        return *this;
    }

    // ========== 状态检查 ==========

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    // ========== 值访问 ==========

    /**
     * @brief 获取值（不检查）
     */
    T& value() & noexcept { return value_; }
    const T& value() const & noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    /**
     * @brief 获取错误（不检查）
     */
    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }

    T valueOr(T default_value) const & {
        return has_value_ ? value_ : std::move(default_value);
    }

    T& operator*() & noexcept { return value_; }
    const T& operator*() const & noexcept { return value_; }
    T&& operator*() && noexcept { return std::move(value_); }

    T* operator->() noexcept { return &value_; }
    const T* operator->() const noexcept { return &value_; }

    // ========== 函数式操作 ==========

    /**
     * @brief 映射操作（成功时）
     */
    template<typename F>
    auto map(F&& func) && -> Expected<std::decay_t<decltype(func(std::move(value_)))>, E> {
        using U = std::decay_t<decltype(func(std::move(value_)))>;
        if (has_value_) {
            return Expected<U, E>(func(std::move(value_)));
        }
        return Expected<U, E>(std::move(error_));
    }

    /**
     * @brief 链式操作
     */
    template<typename F>
    auto andThen(F&& func) && -> decltype(func(std::move(value_))) {
        if (has_value_) {
            return func(std::move(value_));
        }
        return decltype(func(std::move(value_)))(std::move(error_));
    }
};

/**
 * @brief 特化：void类型的Expected
 */
template<typename E>
class Expected<void, E> {
private:
    E error_;
    bool has_value_;

public:
    using value_type = void;
    using error_type = E;

    Expected() : has_value_(true) {}

    Expected(const E& error) : error_(error), has_value_(error.isOk()) {}
    Expected(E&& error) : error_(std::move(error)), has_value_(error_.isOk()) {}

    bool hasValue() const noexcept { return has_value_; }
    bool hasError() const noexcept { return !has_value_; }

    explicit operator bool() const noexcept { return has_value_; }

    E& error() & noexcept { return error_; }
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }
};

// ========== 类型别名 ==========

template<typename T>
using Result = Expected<T, Error>;

using VoidResult = Expected<void, Error>;

/**
 * @brief 成功结果
 */
inline VoidResult success() {
    return VoidResult();
}

}} // namespace gridbind::core

/**
 * @brief 传播错误：表达式失败时直接返回其错误
 *
 * 用于返回 Result<T> 或 VoidResult 的函数内部。
 */
#define GRIDBIND_TRY(expr)                                   \
    do {                                                     \
        auto gridbind_try_result_ = (expr);                  \
        if (gridbind_try_result_.hasError()) {               \
            return std::move(gridbind_try_result_).error();  \
        }                                                    \
    } while (0)
