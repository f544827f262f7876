#pragma once

#include "gridbind/core/Expected.hpp"
#include "gridbind/core/Grid.hpp"
#include <string>

namespace gridbind {
namespace source {

/**
 * @brief 网格数据源接口
 *
 * 解码入口从数据源取得一个完整的网格后再开始解码。
 * fetch 失败时返回的错误会被包装为 UpstreamFailure，
 * describe() 的结果作为错误上下文。
 */
class GridSource {
public:
    virtual ~GridSource() = default;

    /**
     * @brief 取得网格（第 0 行为表头）
     */
    virtual core::Result<core::Grid> fetch() = 0;

    /**
     * @brief 数据源描述，用于日志与错误上下文
     */
    virtual std::string describe() const = 0;
};

}} // namespace gridbind::source
