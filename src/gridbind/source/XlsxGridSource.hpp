#pragma once

#include "gridbind/source/GridSource.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gridbind {
namespace source {

/**
 * @brief XLSX 数据源选项
 */
struct XlsxSourceOptions {
    std::optional<std::string> sheet_name;   // 按名称选择工作表，优先于 sheet_index
    size_t sheet_index = 0;                  // 按顺序选择工作表（0-based）
    std::optional<size_t> max_rows;          // 只读取前 N 个网格行（含表头）
};

/**
 * @brief 从 .xlsx 文件读取一个工作表作为网格
 *
 * 读取 xl/workbook.xml、xl/_rels/workbook.xml.rels、xl/sharedStrings.xml、
 * xl/styles.xml 和选中的工作表。所有失败都以 UpstreamFailure 返回，
 * 上下文为 describe()。
 */
class XlsxGridSource : public GridSource {
public:
    /// 数据块接收器：返回 false 表示停止读取
    using ChunkSink = std::function<bool(const char* data, size_t size)>;

    /**
     * @brief 部件读取器：把 ZIP 内部路径对应的内容分块交给 sink
     * @return 部件不存在时返回 false
     */
    using PartStreamer = std::function<core::Result<bool>(std::string_view part_path, const ChunkSink& sink)>;

    explicit XlsxGridSource(std::string path, XlsxSourceOptions options = XlsxSourceOptions());

    core::Result<core::Grid> fetch() override;
    std::string describe() const override;

    /**
     * @brief 工作簿中全部工作表名称（按工作簿顺序）
     */
    core::Result<std::vector<std::string>> sheetNames() const;

    /**
     * @brief 由部件读取器组装网格
     *
     * 与文件无关的核心流程，fetch() 使用 ZIP 读取器作为 streamer。
     */
    static core::Result<core::Grid> loadFromParts(const PartStreamer& streamer,
                                                  const XlsxSourceOptions& options,
                                                  const std::string& description);

    const std::string& path() const { return path_; }
    const XlsxSourceOptions& options() const { return options_; }

private:
    std::string path_;
    XlsxSourceOptions options_;
};

}} // namespace gridbind::source
