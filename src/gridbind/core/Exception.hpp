/**
 * @file Exception.hpp
 * @brief GridBind异常类定义
 */

#ifndef GRIDBIND_EXCEPTION_HPP
#define GRIDBIND_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace gridbind {
namespace core {

/**
 * @brief GridBind基础异常类
 */
class GridBindException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    GridBindException(const std::string& message,
                      ErrorCode code = ErrorCode::Custom,
                      const char* file = nullptr,
                      int line = 0);

    /**
     * @brief 获取错误代码
     */
    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取错误代码字符串
     */
    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 添加上下文信息
     */
    void addContext(const std::string& context);

    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 解码异常，携带出错单元格的位置
 */
class DecodeException : public GridBindException {
public:
    DecodeException(const std::string& message,
                    ErrorCode code,
                    int row = -1, int col = -1,
                    const char* file = nullptr, int line = 0);

    int getRow() const { return row_; }
    int getCol() const { return col_; }
    bool hasPosition() const { return row_ >= 0 && col_ >= 0; }

    /**
     * @brief A1风格单元格引用，无位置时返回 "Unknown"
     */
    std::string getCellReference() const;

private:
    int row_;
    int col_;
};

/**
 * @brief 数据源（上游）异常
 */
class UpstreamException : public GridBindException {
public:
    UpstreamException(const std::string& message,
                      const std::string& source = "",
                      const char* file = nullptr, int line = 0);

    const std::string& getSource() const { return source_; }

private:
    std::string source_;
};

} // namespace core
} // namespace gridbind

#endif // GRIDBIND_EXCEPTION_HPP
