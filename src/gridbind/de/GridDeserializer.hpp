/**
 * @file GridDeserializer.hpp
 * @brief 网格上的结构化解码引擎
 */

#pragma once

#include "gridbind/core/Grid.hpp"
#include "gridbind/de/CellInterpreter.hpp"
#include "gridbind/de/Cursor.hpp"
#include "gridbind/de/HeaderIndex.hpp"
#include "gridbind/serde/Visitor.hpp"
#include <string_view>

namespace gridbind {
namespace de {

/**
 * @brief 解码协议在网格上的实现
 *
 * 请求的粒度由游标决定：
 * - 网格级（target == Grid，无列）：剩余的全部数据行；
 * - 行级（target == Row，无列）：一行；
 * - 字段级（有列）：一个单元格。
 * 网格级和行级的标量请求读取当前行的第 0 列。
 *
 * 网格和表头索引只读借用，必须在解码期间保持有效。
 * 实例单线程使用，不可重入。
 */
class GridDeserializer : public serde::Deserializer {
public:
    GridDeserializer(const core::Grid& grid, const HeaderIndex& header);

    // 标量
    core::VoidResult deserializeAny(serde::Visitor& visitor) override;
    core::VoidResult deserializeBool(serde::Visitor& visitor) override;
    core::VoidResult deserializeI8(serde::Visitor& visitor) override;
    core::VoidResult deserializeI16(serde::Visitor& visitor) override;
    core::VoidResult deserializeI32(serde::Visitor& visitor) override;
    core::VoidResult deserializeI64(serde::Visitor& visitor) override;
    core::VoidResult deserializeU8(serde::Visitor& visitor) override;
    core::VoidResult deserializeU16(serde::Visitor& visitor) override;
    core::VoidResult deserializeU32(serde::Visitor& visitor) override;
    core::VoidResult deserializeU64(serde::Visitor& visitor) override;
    core::VoidResult deserializeF32(serde::Visitor& visitor) override;
    core::VoidResult deserializeF64(serde::Visitor& visitor) override;
    core::VoidResult deserializeStr(serde::Visitor& visitor) override;
    core::VoidResult deserializeString(serde::Visitor& visitor) override;

    // 可选值与单元值
    core::VoidResult deserializeOption(serde::Visitor& visitor) override;
    core::VoidResult deserializeUnit(serde::Visitor& visitor) override;
    core::VoidResult deserializeUnitStruct(std::string_view name, serde::Visitor& visitor) override;
    core::VoidResult deserializeNewtypeStruct(std::string_view name, serde::Visitor& visitor) override;

    // 结构
    core::VoidResult deserializeSeq(serde::Visitor& visitor) override;
    core::VoidResult deserializeTuple(size_t len, serde::Visitor& visitor) override;
    core::VoidResult deserializeTupleStruct(std::string_view name, size_t len,
                                            serde::Visitor& visitor) override;
    core::VoidResult deserializeMap(serde::Visitor& visitor) override;
    core::VoidResult deserializeStruct(std::string_view name, const serde::FieldNames& fields,
                                       serde::Visitor& visitor) override;
    core::VoidResult deserializeEnum(std::string_view name, const serde::FieldNames& variants,
                                     serde::Visitor& visitor) override;
    core::VoidResult deserializeIdentifier(serde::Visitor& visitor) override;
    core::VoidResult deserializeIgnoredAny(serde::Visitor& visitor) override;

    const Cursor& cursor() const { return cursor_; }

    /**
     * @brief 游标是否指向一个存在的数据行
     */
    bool hasCurrentRow() const;

    /**
     * @brief 从当前行起剩余的数据行数
     */
    size_t remainingRows() const;

private:
    class RowSeqAccess;
    class ColumnSeqAccess;
    class FieldMapAccess;
    class TagEnumAccess;

    const core::Row* currentRow() const;
    const core::Cell* currentCell() const;
    size_t currentColumn() const { return cursor_.column.value_or(0); }
    core::CellPosition currentPosition() const;

    core::Error cellError(core::ErrorCode code) const;
    core::Error zeroRows(std::string_view detail) const;
    core::Error notAtFieldLevel(std::string_view shape) const;

    core::Result<InterpretedScalar> readScalar() const;
    core::Result<double> readNumber() const;
    core::Result<std::string_view> readFormattedText() const;

    template<typename F>
    core::VoidResult withNumber(F&& visit) {
        auto number = readNumber();
        if (number.hasError()) {
            return std::move(number).error();
        }
        return visit(number.value());
    }

    core::VoidResult visitRowAsMap(serde::Visitor& visitor);

    const core::Grid& grid_;
    const HeaderIndex& header_;
    Cursor cursor_;
};

}} // namespace gridbind::de
