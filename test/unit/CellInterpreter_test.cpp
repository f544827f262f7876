// GridBind 库 - 电子表格网格到强类型记录的解码库
// 组件：单元格解释器测试
//
// 原始值可以同时设置多个字段，解释器按固定优先级取其一。

#include "gridbind/de/CellInterpreter.hpp"
#include <gtest/gtest.h>

namespace gridbind {
namespace de {

using core::Cell;
using core::CellErrorValue;
using core::CellValue;

class CellInterpreterTest : public ::testing::Test {
protected:
    static Cell makeCell(CellValue raw,
                         std::optional<std::string> formatted = std::nullopt,
                         std::optional<std::string> tag = std::nullopt) {
        return Cell(std::move(raw), std::move(formatted), std::move(tag));
    }
};

// 测试单一字段的单元格
TEST_F(CellInterpreterTest, ScalarKinds) {
    Cell absent = Cell::absent();
    EXPECT_TRUE(CellInterpreter::interpret(absent).isMissing());

    Cell flag_cell = Cell::boolean(true);
    auto flag = CellInterpreter::interpret(flag_cell);
    EXPECT_EQ(flag.kind, ScalarKind::Boolean);
    EXPECT_TRUE(flag.boolean);

    Cell number_cell = Cell::number(1.25);
    auto number = CellInterpreter::interpret(number_cell);
    EXPECT_EQ(number.kind, ScalarKind::Number);
    EXPECT_DOUBLE_EQ(number.number, 1.25);

    Cell percent_cell = Cell::number(0.5, std::string("50%"), core::NumberFormatKind::Percent);
    EXPECT_EQ(CellInterpreter::interpret(percent_cell).kind, ScalarKind::Number);

    Cell text_cell = Cell::text("hello");
    auto text = CellInterpreter::interpret(text_cell);
    EXPECT_EQ(text.kind, ScalarKind::Text);
    EXPECT_EQ(text.text, "hello");

    Cell err = Cell::error("#DIV/0!");
    auto err_scalar = CellInterpreter::interpret(err);
    EXPECT_EQ(err_scalar.kind, ScalarKind::Text);
    EXPECT_EQ(err_scalar.text, "#DIV/0!");

    Cell formula = Cell::formula("SUM(A1:A3)", std::string("=SUM(A1:A3)"));
    EXPECT_EQ(CellInterpreter::interpret(formula).text, "=SUM(A1:A3)");

    Cell odd = Cell::unrecognized(std::string("?"));
    EXPECT_TRUE(CellInterpreter::interpret(odd).isMissing());
}

// 测试布尔优先于数值和文本
TEST_F(CellInterpreterTest, BooleanWinsOverNumber) {
    CellValue raw;
    raw.bool_value = false;
    raw.number_value = 1.0;
    raw.string_value = "yes";
    Cell cell = makeCell(raw, std::string("FALSE"));

    auto scalar = CellInterpreter::interpret(cell);
    EXPECT_EQ(scalar.kind, ScalarKind::Boolean);
    EXPECT_FALSE(scalar.boolean);
}

// 测试错误标记优先于数值，取显示文本
TEST_F(CellInterpreterTest, ErrorMarkerWinsOverNumber) {
    CellValue raw;
    raw.number_value = 0.0;
    raw.error_value = CellErrorValue{core::CellErrorType::NotAvailable, "lookup failed"};
    Cell cell = makeCell(raw, std::string("#N/A"));

    auto scalar = CellInterpreter::interpret(cell);
    EXPECT_EQ(scalar.kind, ScalarKind::Text);
    EXPECT_EQ(scalar.text, "#N/A");

    // 没有显示文本时视为缺失，而不是回落到数值
    Cell bare = makeCell(raw);
    EXPECT_TRUE(CellInterpreter::interpret(bare).isMissing());
}

// 测试公式标记优先于数值和文本
TEST_F(CellInterpreterTest, FormulaMarkerWinsOverNumber) {
    CellValue raw;
    raw.number_value = 42.0;
    raw.string_value = "forty-two";
    raw.formula_value = "=6*7";
    Cell cell = makeCell(raw, std::string("42"));

    auto scalar = CellInterpreter::interpret(cell);
    EXPECT_EQ(scalar.kind, ScalarKind::Text);
    EXPECT_EQ(scalar.text, "42");
}

// 测试数值优先于文本
TEST_F(CellInterpreterTest, NumberWinsOverString) {
    CellValue raw;
    raw.number_value = 7.5;
    raw.string_value = "seven and a half";
    Cell cell = makeCell(raw, std::string("7.5"), std::string("NUMBER"));

    auto scalar = CellInterpreter::interpret(cell);
    EXPECT_EQ(scalar.kind, ScalarKind::Number);
    EXPECT_DOUBLE_EQ(scalar.number, 7.5);
}

// 测试 DATE、TIME、DATE_TIME 标签的数值都取显示文本
TEST_F(CellInterpreterTest, TemporalNumbersUseDisplayText) {
    CellValue raw;
    raw.number_value = 45292.5;

    Cell date = makeCell(raw, std::string("2024-01-01"), std::string("DATE"));
    Cell time = makeCell(raw, std::string("12:00:00"), std::string("TIME"));
    Cell stamp = makeCell(raw, std::string("2024-01-01 12:00:00"), std::string("DATE_TIME"));

    EXPECT_EQ(CellInterpreter::interpret(date).text, "2024-01-01");
    EXPECT_EQ(CellInterpreter::interpret(time).kind, ScalarKind::Text);
    EXPECT_EQ(CellInterpreter::interpret(time).text, "12:00:00");
    EXPECT_EQ(CellInterpreter::interpret(stamp).text, "2024-01-01 12:00:00");

    Cell untagged_text = makeCell(raw, std::string("45292.5"), std::string("TEXT"));
    EXPECT_EQ(CellInterpreter::interpret(untagged_text).kind, ScalarKind::Number);

    Cell no_display = makeCell(raw, std::nullopt, std::string("TIME"));
    EXPECT_TRUE(CellInterpreter::interpret(no_display).isMissing());
}

TEST_F(CellInterpreterTest, TemporalTags) {
    EXPECT_TRUE(CellInterpreter::isTemporalTag("DATE"));
    EXPECT_TRUE(CellInterpreter::isTemporalTag("TIME"));
    EXPECT_TRUE(CellInterpreter::isTemporalTag("DATE_TIME"));
    EXPECT_FALSE(CellInterpreter::isTemporalTag("NUMBER"));
    EXPECT_FALSE(CellInterpreter::isTemporalTag("date"));
}

}} // namespace gridbind::de
