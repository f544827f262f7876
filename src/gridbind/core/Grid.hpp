#pragma once

#include "gridbind/core/Cell.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace gridbind {
namespace core {

/**
 * @brief 一行单元格，与表头按列对齐
 *
 * 行可以比表头短（数据源会去掉行尾空白）。
 */
using Row = std::vector<Cell>;

/**
 * @brief 判断一行是否全部为缺失单元格（空行同样视为全空）
 */
bool isRowEmpty(const Row& row);

/**
 * @brief 二维网格：第 0 行为表头，其后为数据行
 *
 * 网格由调用方持有；解码期间解码器只读借用它。
 */
class Grid {
public:
    Grid() = default;
    explicit Grid(std::vector<Row> rows) : rows_(std::move(rows)) {}
    Grid(std::initializer_list<Row> rows) : rows_(rows) {}

    size_t rowCount() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    /**
     * @brief 除表头外的数据行数
     */
    size_t dataRowCount() const { return rows_.empty() ? 0 : rows_.size() - 1; }

    const Row& row(size_t index) const { return rows_[index]; }
    const std::vector<Row>& rows() const { return rows_; }

    void addRow(Row row) { rows_.push_back(std::move(row)); }

    /**
     * @brief 所有行中最长的列数
     */
    size_t columnCount() const;

private:
    std::vector<Row> rows_;
};

/**
 * @brief 一个工作表：标题 + 若干数据网格
 */
struct SheetData {
    std::string title;
    std::vector<Grid> data;
};

/**
 * @brief 电子表格服务返回的整本表格
 */
struct Spreadsheet {
    std::string title;
    std::vector<SheetData> sheets;
};

}} // namespace gridbind::core
