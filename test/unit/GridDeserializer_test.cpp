// GridBind 库 - 电子表格网格到强类型记录的解码库
// 组件：网格解码引擎测试
//
// 覆盖表头跳过、行级/字段级可选值、数值与日期优先级、序列耗尽、
// 字段顺序无关以及各类错误的位置信息。

#include "TestRecords.hpp"
#include "gridbind/de/FromGrid.hpp"
#include "gridbind/serde/Value.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <map>
#include <tuple>

namespace gridbind {

namespace fixtures {

struct Tagged {
    std::string name;
    std::vector<std::string> tags;
};

struct Sized {
    int8_t small = 0;
    uint32_t count = 0;
    int32_t big = 0;
};

// 带载荷的枚举：手写访问者，请求 newtype 变体
struct Shape {
    std::string tag;
};

// 透明包装：通过 newtype 请求读取同一位置
struct Meters {
    double value = 0.0;
};

struct Leg {
    std::string name;
    Meters distance;
};

} // namespace fixtures

namespace serde {

template<>
struct Deserialize<fixtures::Tagged> : DeserializeStruct<fixtures::Tagged> {
    static constexpr std::string_view kName = "Tagged";
    static auto fields() {
        return std::make_tuple(field("name", &fixtures::Tagged::name),
                               field("tags", &fixtures::Tagged::tags));
    }
};

template<>
struct Deserialize<fixtures::Sized> : DeserializeStruct<fixtures::Sized> {
    static constexpr std::string_view kName = "Sized";
    static auto fields() {
        return std::make_tuple(field("small", &fixtures::Sized::small),
                               field("count", &fixtures::Sized::count),
                               field("big", &fixtures::Sized::big));
    }
};

template<>
struct Deserialize<fixtures::Shape> {
    static core::Result<fixtures::Shape> deserialize(Deserializer& d) {
        struct ShapeVisitor : Visitor {
            fixtures::Shape value;
            std::string expecting() const override { return "enum Shape"; }
            core::VoidResult visitEnum(EnumAccess& data) override {
                TypedSeed<std::string> tag;
                auto access = data.variantSeed(tag);
                if (access.hasError()) {
                    return std::move(access).error();
                }
                value.tag = *tag.value;
                TypedSeed<double> payload;
                return access.value()->newtypeVariantSeed(payload);
            }
        } visitor;
        static const FieldNames kVariants = {"Circle", "Square"};
        GRIDBIND_TRY(d.deserializeEnum("Shape", kVariants, visitor));
        return std::move(visitor.value);
    }
};

template<>
struct Deserialize<fixtures::Meters> {
    static core::Result<fixtures::Meters> deserialize(Deserializer& d) {
        struct MetersVisitor : Visitor {
            fixtures::Meters value;
            std::string expecting() const override { return "struct Meters"; }
            core::VoidResult visitNewtypeStruct(Deserializer& inner) override {
                auto number = serde::deserialize<double>(inner);
                if (number.hasError()) {
                    return std::move(number).error();
                }
                value.value = number.value();
                return core::success();
            }
        } visitor;
        GRIDBIND_TRY(d.deserializeNewtypeStruct("Meters", visitor));
        return visitor.value;
    }
};

template<>
struct Deserialize<fixtures::Leg> : DeserializeStruct<fixtures::Leg> {
    static constexpr std::string_view kName = "Leg";
    static auto fields() {
        return std::make_tuple(field("name", &fixtures::Leg::name),
                               field("distance", &fixtures::Leg::distance));
    }
};

} // namespace serde

namespace de {

using namespace gridbind::fixtures;
using core::Cell;
using core::ErrorCode;
using core::Grid;

class GridDeserializerTest : public ::testing::Test {
protected:
    // name | age | email
    Grid peopleGrid() const {
        return Grid{
            headerRow({"name", "age", "email"}),
            core::Row{Cell::text("Ann"), Cell::number(30), Cell::text("ann@example.com")},
            core::Row{Cell::text("Bob"), Cell::number(41), Cell::absent()},
        };
    }
};

// 场景A：单列表格解码为记录序列
TEST_F(GridDeserializerTest, SingleColumnSequence) {
    Grid grid{headerRow({"col1"}), textRow({"Value in col 1"})};

    auto result = fromGrid<std::vector<SingleColumn>>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].col1, "Value in col 1");
}

// 场景B：全空行在可选记录序列中为 None
TEST_F(GridDeserializerTest, EmptyRowBecomesNone) {
    Grid grid{headerRow({"col1", "col2"}), textRow({"v1", "v2"}), textRow({nullptr, nullptr})};

    auto result = fromGrid<std::vector<std::optional<TwoColumns>>>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 2u);
    ASSERT_TRUE(result.value()[0].has_value());
    EXPECT_EQ(result.value()[0]->col1, "v1");
    EXPECT_EQ(result.value()[0]->col2, "v2");
    EXPECT_FALSE(result.value()[1].has_value());
}

// 场景C：日期格式的数值按显示文本解码
TEST_F(GridDeserializerTest, DateCellDecodesAsDisplayText) {
    Grid grid{headerRow({"col1"}),
              core::Row{Cell::temporal(45292.0, "2024-01-01", core::NumberFormatKind::Date)}};

    auto text = fromGrid<std::vector<SingleColumn>>(grid);
    ASSERT_TRUE(text.hasValue()) << text.error().fullMessage();
    EXPECT_EQ(text.value()[0].col1, "2024-01-01");

    // 同一个单元格不能作为数值读取
    auto number = fromGrid<std::vector<double>>(grid);
    ASSERT_TRUE(number.hasError());
    EXPECT_EQ(number.error().code, ErrorCode::NotNumber);
}

// 测试时间与日期时间格式同样按显示文本解码
TEST_F(GridDeserializerTest, TimeAndDateTimeCellsDecodeAsText) {
    Grid grid{headerRow({"start", "stamp"}),
              core::Row{Cell::temporal(0.5, "12:00:00", core::NumberFormatKind::Time),
                        Cell::temporal(45292.5, "2024-01-01 12:00:00", core::NumberFormatKind::DateTime)}};

    auto rows = fromGrid<std::vector<std::map<std::string, std::string>>>(grid);
    ASSERT_TRUE(rows.hasValue()) << rows.error().fullMessage();
    ASSERT_EQ(rows.value().size(), 1u);
    EXPECT_EQ(rows.value()[0].at("start"), "12:00:00");
    EXPECT_EQ(rows.value()[0].at("stamp"), "2024-01-01 12:00:00");

    auto time_number = fromGrid<std::vector<std::tuple<double>>>(grid);
    ASSERT_TRUE(time_number.hasError());
    EXPECT_EQ(time_number.error().code, ErrorCode::NotNumber);
    ASSERT_TRUE(time_number.error().position.has_value());
    EXPECT_EQ(time_number.error().position->toReference(), "A2");

    Grid stamp_only{headerRow({"stamp"}),
                    core::Row{Cell::temporal(45292.5, "2024-01-01 12:00:00",
                                             core::NumberFormatKind::DateTime)}};
    auto stamp_number = fromGrid<std::vector<double>>(stamp_only);
    ASSERT_TRUE(stamp_number.hasError());
    EXPECT_EQ(stamp_number.error().code, ErrorCode::NotNumber);
    ASSERT_TRUE(stamp_number.error().position.has_value());
    EXPECT_EQ(stamp_number.error().position->toReference(), "A2");
}

// 场景D：未知枚举变体报错，而不是取默认值
TEST_F(GridDeserializerTest, UnknownVariantIsRejected) {
    Grid grid{headerRow({"id", "amount", "paid", "color"}),
              core::Row{Cell::text("A-1"), Cell::number(9.5), Cell::boolean(true), Cell::text("Purple")}};

    auto result = fromGrid<Order>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::Custom);
    EXPECT_EQ(result.error().message,
              "unknown variant `Purple`, expected one of `Red`, `Green`, `Blue`");
}

// 测试表头行不会作为数据返回
TEST_F(GridDeserializerTest, HeaderRowIsSkipped) {
    auto result = fromGrid<std::vector<Person>>(peopleGrid());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].name, "Ann");
    EXPECT_EQ(result.value()[0].age, 30);
    EXPECT_EQ(result.value()[0].email, std::optional<std::string>("ann@example.com"));
    EXPECT_EQ(result.value()[1].name, "Bob");
    EXPECT_FALSE(result.value()[1].email.has_value());
}

// 测试顶层结构体只读取第一个数据行
TEST_F(GridDeserializerTest, TopLevelRecordReadsFirstRow) {
    auto result = fromGrid<Person>(peopleGrid());
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(result.value().name, "Ann");
    EXPECT_EQ(result.value().age, 30);
}

// 测试列顺序与字段声明顺序无关
TEST_F(GridDeserializerTest, ColumnOrderIndependent) {
    Grid grid{headerRow({"email", "age", "name"}),
              core::Row{Cell::text("c@example.com"), Cell::number(7), Cell::text("Cy")}};

    auto result = fromGrid<Person>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(result.value().name, "Cy");
    EXPECT_EQ(result.value().age, 7);
    EXPECT_EQ(result.value().email, std::optional<std::string>("c@example.com"));
}

// 测试未知列和无名列被忽略
TEST_F(GridDeserializerTest, UnknownAndUnnamedColumnsIgnored) {
    core::Row header{Cell::text("name"), Cell::absent(), Cell::text("nickname"), Cell::text("age")};
    Grid grid{header,
              core::Row{Cell::text("Dee"), Cell::text("junk"), Cell::boolean(false), Cell::number(52)}};

    auto result = fromGrid<Person>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(result.value().name, "Dee");
    EXPECT_EQ(result.value().age, 52);
}

// 测试映射与无类型记录不包含无名列，即使该列有数据
TEST_F(GridDeserializerTest, UnnamedColumnSkippedInMaps) {
    core::Row header{Cell::text("name"), Cell::absent(), Cell::text("age")};
    Grid grid{header, textRow({"Dee", "hidden", "52"})};

    auto maps = fromGrid<std::vector<std::map<std::string, std::string>>>(grid);
    ASSERT_TRUE(maps.hasValue()) << maps.error().fullMessage();
    ASSERT_EQ(maps.value().size(), 1u);
    const auto& row = maps.value()[0];
    EXPECT_EQ(row.size(), 2u);
    std::vector<std::string> keys;
    for (const auto& entry : row) {
        keys.push_back(entry.first);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"age", "name"}));
    EXPECT_EQ(row.at("name"), "Dee");
    EXPECT_EQ(row.at("age"), "52");

    auto values = fromGrid<std::vector<serde::Value>>(grid);
    ASSERT_TRUE(values.hasValue()) << values.error().fullMessage();
    ASSERT_EQ(values.value().size(), 1u);
    const serde::Value& record = values.value()[0];
    ASSERT_TRUE(record.isObject());
    EXPECT_EQ(record.size(), 2u);
    ASSERT_NE(record.find("name"), nullptr);
    ASSERT_NE(record.find("age"), nullptr);
    EXPECT_EQ(record.find(""), nullptr);
    EXPECT_EQ(*record.find("name"), serde::Value("Dee"));
}

// 测试短行：表头有该列但行中没有单元格
TEST_F(GridDeserializerTest, ShortRowReportsMissingField) {
    Grid grid{headerRow({"name", "age"}), textRow({"Eve"})};

    auto result = fromGrid<Person>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::Custom);
    EXPECT_EQ(result.error().message, "missing field `age`");
}

// 测试缺失单元格带位置信息
TEST_F(GridDeserializerTest, AbsentCellReportsPosition) {
    Grid grid{headerRow({"name", "age"}), core::Row{Cell::text("Fay"), Cell::absent()}};

    auto result = fromGrid<Person>(grid);
    ASSERT_TRUE(result.hasError());
    const core::Error& error = result.error();
    EXPECT_EQ(error.code, ErrorCode::MissingValue);
    ASSERT_TRUE(error.position.has_value());
    EXPECT_EQ(error.position->row, 1u);
    EXPECT_EQ(error.position->column, 1u);
    EXPECT_EQ(error.context, "at B2 (row 2, column 2)");
}

// 测试类型不符
TEST_F(GridDeserializerTest, KindMismatchErrors) {
    Grid not_number{headerRow({"name", "age"}), textRow({"Gus", "forty"})};
    auto age = fromGrid<Person>(not_number);
    ASSERT_TRUE(age.hasError());
    EXPECT_EQ(age.error().code, ErrorCode::NotNumber);
    EXPECT_EQ(age.error().position->column, 1u);

    Grid not_bool{headerRow({"id", "amount", "paid", "color"}),
                  core::Row{Cell::text("A-2"), Cell::number(1), Cell::text("yes"), Cell::text("Red")}};
    auto paid = fromGrid<Order>(not_bool);
    ASSERT_TRUE(paid.hasError());
    EXPECT_EQ(paid.error().code, ErrorCode::NotBoolean);
    EXPECT_EQ(paid.error().context, "at C2 (row 2, column 3)");
}

// 测试完整的订单记录（布尔、枚举、可选整数）
TEST_F(GridDeserializerTest, MixedFieldKinds) {
    Grid grid{headerRow({"id", "amount", "paid", "color", "quantity"}),
              core::Row{Cell::text("A-3"), Cell::number(12.25, std::string("12.25")), Cell::boolean(true),
                        Cell::text("Green"), Cell::number(4)},
              core::Row{Cell::text("A-4"), Cell::number(0.5), Cell::boolean(false),
                        Cell::text("Blue"), Cell::absent()}};

    auto result = fromGrid<std::vector<Order>>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 2u);

    const Order& first = result.value()[0];
    EXPECT_EQ(first.id, "A-3");
    EXPECT_DOUBLE_EQ(first.amount, 12.25);
    EXPECT_TRUE(first.paid);
    EXPECT_EQ(first.color, Color::Green);
    EXPECT_EQ(first.quantity, std::optional<int>(4));

    const Order& second = result.value()[1];
    EXPECT_EQ(second.color, Color::Blue);
    EXPECT_FALSE(second.quantity.has_value());
}

// 测试浮点到整数的截断与饱和
TEST_F(GridDeserializerTest, IntegerTruncationSaturates) {
    Grid grid{headerRow({"small", "count", "big"}),
              core::Row{Cell::number(42.9), Cell::number(-3), Cell::number(1e12)}};

    auto result = fromGrid<Sized>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    EXPECT_EQ(result.value().small, 42);
    EXPECT_EQ(result.value().count, 0u);
    EXPECT_EQ(result.value().big, std::numeric_limits<int32_t>::max());
}

// 测试数值单元格作为文本时使用显示文本
TEST_F(GridDeserializerTest, NumberAsTextUsesFormattedValue) {
    Grid grid{headerRow({"col1"}), core::Row{Cell::number(3.5, std::string("3.50"))}};

    auto text = fromGrid<std::vector<std::string>>(grid);
    ASSERT_TRUE(text.hasValue()) << text.error().fullMessage();
    EXPECT_EQ(text.value(), std::vector<std::string>{"3.50"});

    auto number = fromGrid<std::vector<double>>(grid);
    ASSERT_TRUE(number.hasValue());
    EXPECT_DOUBLE_EQ(number.value()[0], 3.5);
}

// 测试每一行都产生 Some 或 None，不会被跳过
TEST_F(GridDeserializerTest, RowOptionTotality) {
    Grid grid{headerRow({"col1"}), textRow({"a"}), core::Row{}, textRow({nullptr}), textRow({"d"})};

    auto result = fromGrid<std::vector<std::optional<SingleColumn>>>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 4u);
    EXPECT_TRUE(result.value()[0].has_value());
    EXPECT_FALSE(result.value()[1].has_value());
    EXPECT_FALSE(result.value()[2].has_value());
    EXPECT_EQ(result.value()[3]->col1, "d");
}

// 测试部分填充的行按 Some 处理，缺失字段随后报错
TEST_F(GridDeserializerTest, PartiallyPopulatedRowIsSome) {
    Grid grid{headerRow({"col1", "col2"}), textRow({nullptr, "only second"})};

    auto result = fromGrid<std::vector<std::optional<TwoColumns>>>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::MissingValue);
    EXPECT_EQ(result.error().position->column, 0u);
}

// 测试空行作为记录解码
TEST_F(GridDeserializerTest, EmptyRowAsRecordIsZeroRows) {
    Grid grid{headerRow({"col1"}), textRow({"a"}), textRow({nullptr})};

    auto result = fromGrid<std::vector<SingleColumn>>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::ZeroRows);
}

// 测试没有行或只有表头的网格
TEST_F(GridDeserializerTest, EmptyAndHeaderOnlyGrids) {
    auto empty = fromGrid<std::vector<Person>>(Grid());
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code, ErrorCode::ZeroRows);

    Grid header_only{headerRow({"name", "age"})};

    auto records = fromGrid<std::vector<Person>>(header_only);
    ASSERT_TRUE(records.hasValue());
    EXPECT_TRUE(records.value().empty());

    auto single = fromGrid<Person>(header_only);
    ASSERT_TRUE(single.hasError());
    EXPECT_EQ(single.error().code, ErrorCode::ZeroRows);

    auto optional = fromGrid<std::optional<Person>>(header_only);
    ASSERT_TRUE(optional.hasValue());
    EXPECT_FALSE(optional.value().has_value());

    auto unit = fromGrid<std::monostate>(header_only);
    EXPECT_TRUE(unit.hasValue());
}

// 测试顶层可选记录：第一个数据行全空时为 None
TEST_F(GridDeserializerTest, BlankFirstRowAsOptionalRecord) {
    Grid blank_first{headerRow({"col1"}), textRow({nullptr}), textRow({"x"})};

    auto none = fromGrid<std::optional<SingleColumn>>(blank_first);
    ASSERT_TRUE(none.hasValue()) << none.error().fullMessage();
    EXPECT_FALSE(none.value().has_value());

    Grid filled_first{headerRow({"col1"}), textRow({"x"}), textRow({nullptr})};

    auto some = fromGrid<std::optional<SingleColumn>>(filled_first);
    ASSERT_TRUE(some.hasValue()) << some.error().fullMessage();
    ASSERT_TRUE(some.value().has_value());
    EXPECT_EQ(some.value()->col1, "x");
}

// 测试单元值只能对应空数据
TEST_F(GridDeserializerTest, UnitRequiresEmptyData) {
    auto populated = fromGrid<std::monostate>(peopleGrid());
    ASSERT_TRUE(populated.hasError());
    EXPECT_EQ(populated.error().code, ErrorCode::ZeroRows);

    Grid grid{headerRow({"col1"}), core::Row{}, textRow({"x"})};
    auto rows = fromGrid<std::vector<std::monostate>>(grid);
    ASSERT_TRUE(rows.hasError());
    EXPECT_EQ(rows.error().code, ErrorCode::ZeroRows);
}

// 测试元组按位置读取行内单元格，忽略表头名称
TEST_F(GridDeserializerTest, TupleRowsArePositional) {
    Grid grid{headerRow({"whatever", "names"}),
              core::Row{Cell::text("a"), Cell::number(1)},
              core::Row{Cell::text("b"), Cell::number(2)}};

    auto result = fromGrid<std::vector<std::tuple<std::string, int>>>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[1], std::make_tuple(std::string("b"), 2));
}

// 测试定长元组的行数不足
TEST_F(GridDeserializerTest, TupleLengthMismatch) {
    Grid grid{headerRow({"col1"}), textRow({"only"})};

    auto result = fromGrid<std::tuple<SingleColumn, SingleColumn>>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::Custom);
    EXPECT_EQ(result.error().message, "invalid length 1, expected a tuple of size 2");
}

// 测试序列在最后一个数据行之后结束
TEST_F(GridDeserializerTest, SequenceEndsAfterLastRow) {
    Grid grid{headerRow({"col1"}), textRow({"a"}), textRow({nullptr}), textRow({"c"})};

    auto rows = fromGrid<std::vector<std::optional<SingleColumn>>>(grid);
    ASSERT_TRUE(rows.hasValue()) << rows.error().fullMessage();
    ASSERT_EQ(rows.value().size(), 3u);
    EXPECT_EQ(rows.value()[0]->col1, "a");
    EXPECT_FALSE(rows.value()[1].has_value());
    EXPECT_EQ(rows.value()[2]->col1, "c");

    // 行数恰好等于元组长度
    Grid two{headerRow({"col1"}), textRow({"a"}), textRow({"b"})};
    auto pair = fromGrid<std::tuple<SingleColumn, SingleColumn>>(two);
    ASSERT_TRUE(pair.hasValue()) << pair.error().fullMessage();
    EXPECT_EQ(std::get<1>(pair.value()).col1, "b");
}

// 测试单元格内不能解码序列
TEST_F(GridDeserializerTest, SequenceFromSingleCellFails) {
    Grid grid{headerRow({"name", "tags"}), textRow({"n", "a,b"})};

    auto result = fromGrid<Tagged>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::Custom);
    EXPECT_EQ(result.error().message, "cannot decode a sequence from the single cell at B2");
}

// 测试行解码为映射：键为表头名，值为显示文本
TEST_F(GridDeserializerTest, RowsAsStringMaps) {
    auto result = fromGrid<std::vector<std::map<std::string, std::string>>>(
        Grid{headerRow({"name", "age"}), core::Row{Cell::text("Ann"), Cell::number(30)}});
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    ASSERT_EQ(result.value().size(), 1u);
    const auto& row = result.value()[0];
    EXPECT_EQ(row.at("name"), "Ann");
    EXPECT_EQ(row.at("age"), "30");
}

// 测试无类型解码
TEST_F(GridDeserializerTest, UntypedValues) {
    Grid grid{headerRow({"name", "age", "active"}),
              core::Row{Cell::text("Ann"), Cell::number(30), Cell::boolean(true)},
              core::Row{},
              core::Row{Cell::text("Bob"), Cell::absent(), Cell::error("#N/A")}};

    auto result = fromGrid<serde::Value>(grid);
    ASSERT_TRUE(result.hasValue()) << result.error().fullMessage();
    const serde::Value& value = result.value();
    ASSERT_TRUE(value.isArray());
    ASSERT_EQ(value.size(), 3u);

    const serde::Value& ann = value.asArray()[0];
    ASSERT_TRUE(ann.isObject());
    EXPECT_EQ(*ann.find("name"), serde::Value("Ann"));
    EXPECT_EQ(*ann.find("age"), serde::Value(30.0));
    EXPECT_EQ(*ann.find("active"), serde::Value(true));

    EXPECT_TRUE(value.asArray()[1].isNull());

    const serde::Value& bob = value.asArray()[2];
    EXPECT_TRUE(bob.find("age")->isNull());
    EXPECT_EQ(*bob.find("active"), serde::Value("#N/A"));
}

// 测试带载荷的枚举变体不受支持
TEST_F(GridDeserializerTest, PayloadVariantUnsupported) {
    Grid grid{headerRow({"shape"}), textRow({"Circle"})};

    auto result = fromGrid<Shape>(grid);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::UnsupportedVariant);
    EXPECT_EQ(result.error().context, "newtype variant requested at A2");
}

// 测试枚举请求时没有剩余行
TEST_F(GridDeserializerTest, EnumWithoutRows) {
    auto result = fromGrid<Color>(Grid{headerRow({"color"})});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::ZeroRows);
}

// 测试序列元素失败后游标仍然前进
TEST_F(GridDeserializerTest, CursorAdvancesPastFailedRow) {
    Grid grid = peopleGrid();
    HeaderIndex header = HeaderIndex::fromRow(grid.row(0));
    GridDeserializer deserializer(grid, header);

    EXPECT_TRUE(deserializer.hasCurrentRow());
    EXPECT_EQ(deserializer.remainingRows(), 2u);

    auto numbers = serde::deserialize<std::vector<double>>(deserializer);
    ASSERT_TRUE(numbers.hasError());  // 第一列是文本
    EXPECT_EQ(numbers.error().code, ErrorCode::NotNumber);
    EXPECT_EQ(deserializer.cursor().row, 1u);
    EXPECT_FALSE(deserializer.cursor().column.has_value());
}

// 测试异常风格接口
TEST_F(GridDeserializerTest, OrThrowRaisesDecodeException) {
    Grid grid{headerRow({"name", "age"}), textRow({"Hal", "old"})};

    try {
        fromGridOrThrow<Person>(grid);
        FAIL() << "expected DecodeException";
    } catch (const core::DecodeException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::NotNumber);
        EXPECT_TRUE(e.hasPosition());
        EXPECT_EQ(e.getCellReference(), "B2");
    }

    auto people = fromGridOrThrow<std::vector<Person>>(peopleGrid());
    EXPECT_EQ(people.size(), 2u);
}

// 测试 newtype 包装读取同一单元格
TEST_F(GridDeserializerTest, NewtypeStructIsTransparent) {
    Grid grid{
        headerRow({"name", "distance"}),
        core::Row{Cell::text("ridge"), Cell::number(12.5)},
        core::Row{Cell::text("valley"), Cell::text("far")},
    };

    auto legs = fromGrid<std::vector<Leg>>(grid);
    ASSERT_TRUE(legs.hasError());
    EXPECT_EQ(legs.error().code, ErrorCode::NotNumber);
    EXPECT_EQ(legs.error().context, "at B3 (row 3, column 2)");

    Grid valid{
        headerRow({"name", "distance"}),
        core::Row{Cell::text("ridge"), Cell::number(12.5)},
    };
    auto ok = fromGrid<std::vector<Leg>>(valid);
    ASSERT_TRUE(ok.hasValue()) << ok.error().fullMessage();
    ASSERT_EQ(ok.value().size(), 1u);
    EXPECT_DOUBLE_EQ(ok.value()[0].distance.value, 12.5);
}

}} // namespace gridbind::de
