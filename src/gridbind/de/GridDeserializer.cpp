#include "gridbind/de/GridDeserializer.hpp"
#include "gridbind/serde/StrDeserializer.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <cmath>
#include <limits>
#include <fmt/format.h>

namespace gridbind {
namespace de {

namespace {

/**
 * @brief 浮点截断为整数：NaN 为 0，超出范围时取边界值
 */
template<typename T>
T truncateTo(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    if (value <= static_cast<double>(std::numeric_limits<T>::min())) {
        return std::numeric_limits<T>::min();
    }
    if (value >= static_cast<double>(std::numeric_limits<T>::max())) {
        return std::numeric_limits<T>::max();
    }
    return static_cast<T>(value);
}

} // namespace

// ========== 访问对象 ==========

/**
 * @brief 网格级序列：元素为剩余的数据行
 */
class GridDeserializer::RowSeqAccess : public serde::SeqAccess {
public:
    explicit RowSeqAccess(GridDeserializer& de) : de_(de) {}

    core::Result<bool> nextElementSeed(serde::DeserializeSeed& seed) override {
        if (!de_.hasCurrentRow()) {
            return false;
        }

        Cursor& cursor = de_.cursor_;
        cursor.column.reset();
        const DecodeTarget saved = cursor.target;
        cursor.target = DecodeTarget::Row;

        auto status = seed.deserialize(de_);

        cursor.target = saved;
        cursor.column.reset();
        ++cursor.row;

        if (status.hasError()) {
            return std::move(status).error();
        }
        return true;
    }

    std::optional<size_t> sizeHint() const override {
        return de_.remainingRows();
    }

private:
    GridDeserializer& de_;
};

/**
 * @brief 行级序列：按位置依次给出当前行的单元格，忽略表头
 */
class GridDeserializer::ColumnSeqAccess : public serde::SeqAccess {
public:
    ColumnSeqAccess(GridDeserializer& de, const core::Row& row) : de_(de), row_(row) {}

    core::Result<bool> nextElementSeed(serde::DeserializeSeed& seed) override {
        if (next_ >= row_.size()) {
            de_.cursor_.column.reset();
            return false;
        }
        de_.cursor_.column = next_++;
        GRIDBIND_TRY(seed.deserialize(de_));
        return true;
    }

    std::optional<size_t> sizeHint() const override {
        return row_.size() - next_;
    }

private:
    GridDeserializer& de_;
    const core::Row& row_;
    size_t next_ = 0;
};

/**
 * @brief 行作为映射：键为表头字段名，跳过无名列
 */
class GridDeserializer::FieldMapAccess : public serde::MapAccess {
public:
    FieldMapAccess(GridDeserializer& de, const core::Row& row) : de_(de), row_(row) {}

    core::Result<bool> nextKeySeed(serde::DeserializeSeed& seed) override {
        Cursor& cursor = de_.cursor_;
        const size_t from = cursor.column ? *cursor.column + 1 : 0;
        const auto column = de_.header_.nextFieldColumn(from, row_.size());
        if (!column) {
            cursor.column.reset();
            return false;
        }

        cursor.column = *column;
        const auto name = de_.header_.fieldName(*column);
        GRIDBIND_LOG_DECODE_TRACE("key `{}` at column {}", *name, *column);

        serde::StrDeserializer key(*name);
        GRIDBIND_TRY(seed.deserialize(key));
        return true;
    }

    core::VoidResult nextValueSeed(serde::DeserializeSeed& seed) override {
        return seed.deserialize(de_);
    }

    std::optional<size_t> sizeHint() const override {
        return de_.header_.fieldCount();
    }

private:
    GridDeserializer& de_;
    const core::Row& row_;
};

/**
 * @brief 枚举：标签为当前单元格的显示文本，只支持单元变体
 */
class GridDeserializer::TagEnumAccess : public serde::EnumAccess,
                                        public serde::VariantAccess {
public:
    explicit TagEnumAccess(GridDeserializer& de) : de_(de) {}

    core::Result<serde::VariantAccess*> variantSeed(serde::DeserializeSeed& seed) override {
        de_.cursor_.parsing_tag_only = true;
        auto status = seed.deserialize(de_);
        de_.cursor_.parsing_tag_only = false;
        if (status.hasError()) {
            return std::move(status).error();
        }
        return static_cast<serde::VariantAccess*>(this);
    }

    core::VoidResult unitVariant() override {
        return core::success();
    }

    core::VoidResult newtypeVariantSeed(serde::DeserializeSeed& /*seed*/) override {
        return unsupported("newtype");
    }

    core::VoidResult tupleVariant(size_t /*len*/, serde::Visitor& /*visitor*/) override {
        return unsupported("tuple");
    }

    core::VoidResult structVariant(const serde::FieldNames& /*fields*/,
                                   serde::Visitor& /*visitor*/) override {
        return unsupported("struct");
    }

private:
    core::Error unsupported(std::string_view shape) const {
        return core::makeError(core::ErrorCode::UnsupportedVariant,
                               core::toString(core::ErrorCode::UnsupportedVariant),
                               fmt::format("{} variant requested at {}", shape,
                                           de_.currentPosition().toReference()));
    }

    GridDeserializer& de_;
};

// ========== 构造与游标 ==========

GridDeserializer::GridDeserializer(const core::Grid& grid, const HeaderIndex& header)
    : grid_(grid)
    , header_(header) {
}

bool GridDeserializer::hasCurrentRow() const {
    return cursor_.gridRow() < grid_.rowCount();
}

size_t GridDeserializer::remainingRows() const {
    return hasCurrentRow() ? grid_.rowCount() - cursor_.gridRow() : 0;
}

const core::Row* GridDeserializer::currentRow() const {
    if (!hasCurrentRow()) {
        return nullptr;
    }
    return &grid_.row(cursor_.gridRow());
}

const core::Cell* GridDeserializer::currentCell() const {
    const core::Row* row = currentRow();
    if (!row) {
        return nullptr;
    }
    const size_t column = currentColumn();
    if (column >= row->size()) {
        return nullptr;
    }
    return &(*row)[column];
}

core::CellPosition GridDeserializer::currentPosition() const {
    return core::CellPosition{static_cast<uint32_t>(cursor_.gridRow()),
                              static_cast<uint32_t>(currentColumn())};
}

core::Error GridDeserializer::cellError(core::ErrorCode code) const {
    return core::makeCellError(code, currentPosition());
}

core::Error GridDeserializer::zeroRows(std::string_view detail) const {
    return core::makeError(core::ErrorCode::ZeroRows,
                           core::toString(core::ErrorCode::ZeroRows),
                           fmt::format("{} at data row {}", detail, cursor_.row + 1));
}

core::Error GridDeserializer::notAtFieldLevel(std::string_view shape) const {
    return core::makeCustomError(fmt::format("cannot decode a {} from the single cell at {}",
                                             shape, currentPosition().toReference()));
}

// ========== 单元格读取 ==========

core::Result<InterpretedScalar> GridDeserializer::readScalar() const {
    if (!hasCurrentRow()) {
        return zeroRows("scalar requested with no row left");
    }
    const core::Cell* cell = currentCell();
    if (!cell) {
        return InterpretedScalar{};
    }
    InterpretedScalar scalar = CellInterpreter::interpret(*cell);
    GRIDBIND_LOG_DECODE_TRACE("{} at {}", toString(scalar.kind), currentPosition().toReference());
    return scalar;
}

core::Result<double> GridDeserializer::readNumber() const {
    auto scalar = readScalar();
    if (scalar.hasError()) {
        return std::move(scalar).error();
    }
    switch (scalar->kind) {
        case ScalarKind::Number:
            return scalar->number;
        case ScalarKind::Missing:
            return cellError(core::ErrorCode::MissingValue);
        default:
            return cellError(core::ErrorCode::NotNumber);
    }
}

core::Result<std::string_view> GridDeserializer::readFormattedText() const {
    if (!hasCurrentRow()) {
        return zeroRows("text requested with no row left");
    }
    const core::Cell* cell = currentCell();
    if (!cell || !cell->getFormattedValue()) {
        return cellError(core::ErrorCode::MissingValue);
    }
    return std::string_view(*cell->getFormattedValue());
}

// ========== 标量 ==========

core::VoidResult GridDeserializer::deserializeAny(serde::Visitor& visitor) {
    if (cursor_.atGridLevel()) {
        RowSeqAccess rows(*this);
        return visitor.visitSeq(rows);
    }

    if (cursor_.atRowLevel()) {
        const core::Row* row = currentRow();
        if (!row || core::isRowEmpty(*row)) {
            return visitor.visitNone();
        }
        return visitRowAsMap(visitor);
    }

    const core::Cell* cell = currentCell();
    if (!cell || cell->isAbsent()) {
        return visitor.visitNone();
    }
    const InterpretedScalar scalar = CellInterpreter::interpret(*cell);
    switch (scalar.kind) {
        case ScalarKind::Boolean:
            return visitor.visitBool(scalar.boolean);
        case ScalarKind::Number:
            return visitor.visitF64(scalar.number);
        case ScalarKind::Text:
            return visitor.visitStr(scalar.text);
        default:
            // 无法识别的形态按无值处理
            return visitor.visitNone();
    }
}

core::VoidResult GridDeserializer::deserializeBool(serde::Visitor& visitor) {
    auto scalar = readScalar();
    if (scalar.hasError()) {
        return std::move(scalar).error();
    }
    if (scalar->kind == ScalarKind::Missing) {
        return cellError(core::ErrorCode::MissingValue);
    }
    if (scalar->kind != ScalarKind::Boolean) {
        return cellError(core::ErrorCode::NotBoolean);
    }
    return visitor.visitBool(scalar->boolean);
}

core::VoidResult GridDeserializer::deserializeI8(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitI8(truncateTo<int8_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeI16(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitI16(truncateTo<int16_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeI32(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitI32(truncateTo<int32_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeI64(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitI64(truncateTo<int64_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeU8(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitU8(truncateTo<uint8_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeU16(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitU16(truncateTo<uint16_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeU32(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitU32(truncateTo<uint32_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeU64(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitU64(truncateTo<uint64_t>(n)); });
}

core::VoidResult GridDeserializer::deserializeF32(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitF32(static_cast<float>(n)); });
}

core::VoidResult GridDeserializer::deserializeF64(serde::Visitor& visitor) {
    return withNumber([&](double n) { return visitor.visitF64(n); });
}

core::VoidResult GridDeserializer::deserializeStr(serde::Visitor& visitor) {
    auto text = readFormattedText();
    if (text.hasError()) {
        return std::move(text).error();
    }
    return visitor.visitStr(text.value());
}

core::VoidResult GridDeserializer::deserializeString(serde::Visitor& visitor) {
    return deserializeStr(visitor);
}

// ========== 可选值与单元值 ==========

core::VoidResult GridDeserializer::deserializeOption(serde::Visitor& visitor) {
    if (cursor_.atGridLevel()) {
        // 顶层可选值只看第一个数据行，与顶层记录读取的行一致
        const core::Row* row = currentRow();
        if (!row || core::isRowEmpty(*row)) {
            return visitor.visitNone();
        }
        return visitor.visitSome(*this);
    }

    if (cursor_.atRowLevel()) {
        const core::Row* row = currentRow();
        if (!row || core::isRowEmpty(*row)) {
            return visitor.visitNone();
        }
        return visitor.visitSome(*this);
    }

    const core::Cell* cell = currentCell();
    if (!cell || cell->isAbsent()) {
        return visitor.visitNone();
    }
    return visitor.visitSome(*this);
}

core::VoidResult GridDeserializer::deserializeUnit(serde::Visitor& visitor) {
    if (cursor_.atGridLevel()) {
        if (hasCurrentRow()) {
            return zeroRows("unit requested but rows remain");
        }
        return visitor.visitUnit();
    }

    if (cursor_.atRowLevel()) {
        const core::Row* row = currentRow();
        if (row && !core::isRowEmpty(*row)) {
            return zeroRows("unit requested on a populated row");
        }
        return visitor.visitUnit();
    }

    const core::Cell* cell = currentCell();
    if (cell && cell->isPopulated()) {
        return zeroRows(fmt::format("unit requested on populated cell {}",
                                    currentPosition().toReference()));
    }
    return visitor.visitUnit();
}

core::VoidResult GridDeserializer::deserializeUnitStruct(std::string_view /*name*/,
                                                         serde::Visitor& visitor) {
    return deserializeUnit(visitor);
}

core::VoidResult GridDeserializer::deserializeNewtypeStruct(std::string_view /*name*/,
                                                            serde::Visitor& visitor) {
    return visitor.visitNewtypeStruct(*this);
}

// ========== 结构 ==========

core::VoidResult GridDeserializer::deserializeSeq(serde::Visitor& visitor) {
    if (cursor_.atFieldLevel()) {
        return notAtFieldLevel("sequence");
    }

    if (cursor_.atGridLevel()) {
        DECODE_DEBUG("sequence over {} remaining rows", remainingRows());
        RowSeqAccess rows(*this);
        return visitor.visitSeq(rows);
    }

    const core::Row* row = currentRow();
    if (!row) {
        return zeroRows("sequence requested with no row left");
    }
    ColumnSeqAccess cells(*this, *row);
    auto status = visitor.visitSeq(cells);
    cursor_.column.reset();
    return status;
}

core::VoidResult GridDeserializer::deserializeTuple(size_t /*len*/, serde::Visitor& visitor) {
    return deserializeSeq(visitor);
}

core::VoidResult GridDeserializer::deserializeTupleStruct(std::string_view /*name*/, size_t /*len*/,
                                                          serde::Visitor& visitor) {
    return deserializeSeq(visitor);
}

core::VoidResult GridDeserializer::deserializeMap(serde::Visitor& visitor) {
    if (cursor_.atFieldLevel()) {
        return notAtFieldLevel("map");
    }
    const core::Row* row = currentRow();
    if (!row) {
        return zeroRows("record requested with no row left");
    }
    if (core::isRowEmpty(*row)) {
        return zeroRows("record requested on an empty row");
    }
    return visitRowAsMap(visitor);
}

core::VoidResult GridDeserializer::deserializeStruct(std::string_view /*name*/,
                                                     const serde::FieldNames& /*fields*/,
                                                     serde::Visitor& visitor) {
    return deserializeMap(visitor);
}

core::VoidResult GridDeserializer::visitRowAsMap(serde::Visitor& visitor) {
    FieldMapAccess fields(*this, *currentRow());
    auto status = visitor.visitMap(fields);
    cursor_.column.reset();
    return status;
}

core::VoidResult GridDeserializer::deserializeEnum(std::string_view name,
                                                   const serde::FieldNames& /*variants*/,
                                                   serde::Visitor& visitor) {
    if (!hasCurrentRow()) {
        return zeroRows(fmt::format("enum {} requested with no row left", name));
    }
    TagEnumAccess access(*this);
    return visitor.visitEnum(access);
}

core::VoidResult GridDeserializer::deserializeIdentifier(serde::Visitor& visitor) {
    if (cursor_.parsing_tag_only) {
        return deserializeStr(visitor);
    }
    const auto name = header_.fieldName(currentColumn());
    if (!name) {
        return cellError(core::ErrorCode::MissingValue);
    }
    return visitor.visitStr(*name);
}

core::VoidResult GridDeserializer::deserializeIgnoredAny(serde::Visitor& visitor) {
    return deserializeAny(visitor);
}

}} // namespace gridbind::de
