// GridBind 库 - 电子表格网格到强类型记录的解码库
// 组件：数据源测试
//
// 内存电子表格数据源，以及基于部件流的 XLSX 加载（不经过 ZIP）。

#include "TestRecords.hpp"
#include "gridbind/de/FromGrid.hpp"
#include "gridbind/source/InMemoryGridSource.hpp"
#include "gridbind/source/XlsxGridSource.hpp"
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <tuple>

namespace gridbind {

namespace fixtures {

struct Member {
    std::string name;
    int age = 0;
    std::optional<std::string> joined;
};

} // namespace fixtures

namespace serde {

template<>
struct Deserialize<fixtures::Member> : DeserializeStruct<fixtures::Member> {
    static constexpr std::string_view kName = "Member";
    static auto fields() {
        return std::make_tuple(field("name", &fixtures::Member::name),
                               field("age", &fixtures::Member::age),
                               field("joined", &fixtures::Member::joined));
    }
};

} // namespace serde

namespace source {

using core::ErrorCode;
using fixtures::Member;

// ========== InMemoryGridSource ==========

class InMemoryGridSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        spreadsheet_.title = "Club";
        spreadsheet_.sheets.push_back(core::SheetData{
            "Members",
            {core::Grid{fixtures::headerRow({"name", "age"}),
                        core::Row{core::Cell::text("Ann"), core::Cell::number(30)}}}});
        spreadsheet_.sheets.push_back(core::SheetData{"Notes", {}});
    }

    core::Spreadsheet spreadsheet_;
};

// 测试默认选择第一个工作表
TEST_F(InMemoryGridSourceTest, DefaultSheet) {
    InMemoryGridSource source(spreadsheet_);
    EXPECT_EQ(source.describe(), "in-memory spreadsheet 'Club', sheet #0");

    auto members = de::fromSource<std::vector<Member>>(source);
    ASSERT_TRUE(members.hasValue()) << members.error().fullMessage();
    ASSERT_EQ(members.value().size(), 1u);
    EXPECT_EQ(members.value()[0].name, "Ann");
    EXPECT_EQ(members.value()[0].age, 30);
}

// 测试按名称选择以及找不到工作表
TEST_F(InMemoryGridSourceTest, SelectByTitle) {
    InMemoryGridSource members(spreadsheet_, SheetSelector::byTitle("Members"));
    EXPECT_TRUE(members.fetch().hasValue());

    InMemoryGridSource missing(spreadsheet_, SheetSelector::byTitle("Ledger"));
    auto grid = missing.fetch();
    ASSERT_TRUE(grid.hasError());
    EXPECT_EQ(grid.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(grid.error().message, "sheet 'Ledger' not found");
    EXPECT_EQ(grid.error().context, "in-memory spreadsheet 'Club', sheet 'Ledger'");
}

TEST_F(InMemoryGridSourceTest, SheetWithoutGrid) {
    InMemoryGridSource notes(spreadsheet_, SheetSelector::byIndex(1));
    auto grid = notes.fetch();
    ASSERT_TRUE(grid.hasError());
    EXPECT_EQ(grid.error().message, "sheet 'Notes' has no grid data");

    InMemoryGridSource out_of_range(spreadsheet_, SheetSelector::byIndex(4));
    auto none = out_of_range.fetch();
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().message, "sheet index 4 out of range (2 sheets)");
}

// 上游错误原样传出，解码错误不受影响
TEST_F(InMemoryGridSourceTest, FromSourceErrors) {
    InMemoryGridSource missing(spreadsheet_, SheetSelector::byTitle("Ledger"));
    auto result = de::fromSource<std::vector<Member>>(missing);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(result.error().message, "sheet 'Ledger' not found");

    try {
        de::fromSourceOrThrow<std::vector<Member>>(missing);
        FAIL() << "expected UpstreamException";
    } catch (const core::UpstreamException& e) {
        EXPECT_EQ(e.getSource(), "in-memory spreadsheet 'Club', sheet 'Ledger'");
    }

    InMemoryGridSource members(spreadsheet_);
    auto wrong = de::fromSource<std::vector<std::tuple<int, int>>>(members);
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code, ErrorCode::NotNumber);
    EXPECT_EQ(wrong.error().context, "at A2 (row 2, column 1)");
}

namespace {

// 以非上游错误失败的数据源
class BrokenSource : public GridSource {
public:
    core::Result<core::Grid> fetch() override {
        return core::makeCustomError("socket closed");
    }
    std::string describe() const override { return "broken source"; }
};

} // namespace

// 测试其他错误被包装为上游错误
TEST(FromSourceTest, WrapsOtherErrors) {
    BrokenSource source;
    auto result = de::fromSource<std::vector<Member>>(source);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(result.error().message, "socket closed");
    EXPECT_EQ(result.error().context, "broken source");
}

// 测试整本电子表格入口
TEST_F(InMemoryGridSourceTest, FromSpreadsheet) {
    auto members = de::fromSpreadsheet<std::vector<Member>>(spreadsheet_);
    ASSERT_TRUE(members.hasValue());
    EXPECT_EQ(members.value().size(), 1u);

    core::Spreadsheet empty{"Blank", {}};
    auto none = de::fromSpreadsheet<std::vector<Member>>(empty);
    ASSERT_TRUE(none.hasError());
    EXPECT_EQ(none.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(none.error().message, "spreadsheet has no sheets");
    EXPECT_EQ(none.error().context, "Blank");

    core::Spreadsheet gridless{"Gridless", {core::SheetData{"Only", {}}}};
    auto no_grid = de::fromSpreadsheet<std::vector<Member>>(gridless);
    ASSERT_TRUE(no_grid.hasError());
    EXPECT_EQ(no_grid.error().message, "sheet has no grid data");
    EXPECT_EQ(no_grid.error().context, "Only");

    EXPECT_THROW(de::fromSpreadsheetOrThrow<std::vector<Member>>(empty), core::UpstreamException);
}

// ========== XlsxGridSource（部件流） ==========

class XlsxPartsTest : public ::testing::Test {
protected:
    void SetUp() override {
        parts_["xl/_rels/workbook.xml.rels"] = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
<Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>
<Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet2.xml"/>
<Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles" Target="styles.xml"/>
</Relationships>)";

        parts_["xl/workbook.xml"] = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
<sheets><sheet name="People" sheetId="1" r:id="rId1"/><sheet name="Empty" sheetId="2" r:id="rId2"/></sheets>
</workbook>)";

        parts_["xl/sharedStrings.xml"] =
            "<sst><si><t>name</t></si><si><t>age</t></si><si><t>joined</t></si>"
            "<si><t>Ann</t></si><si><t>Bob</t></si></sst>";

        parts_["xl/styles.xml"] =
            "<styleSheet><cellXfs><xf numFmtId=\"0\"/><xf numFmtId=\"14\"/></cellXfs></styleSheet>";

        parts_["xl/worksheets/sheet1.xml"] = R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheetData>
<row r="1"><c r="A1" t="s"><v>0</v></c><c r="B1" t="s"><v>1</v></c><c r="C1" t="s"><v>2</v></c></row>
<row r="2"><c r="A2" t="s"><v>3</v></c><c r="B2"><v>30</v></c><c r="C2" s="1"><v>45292</v></c></row>
<row r="3"><c r="A3" t="s"><v>4</v></c><c r="B3"><v>41</v></c></row>
</sheetData></worksheet>)";

        parts_["xl/worksheets/sheet2.xml"] = "<worksheet><sheetData/></worksheet>";
    }

    // 按固定大小分块把部件喂给接收器
    XlsxGridSource::PartStreamer streamer(size_t chunk = 16) const {
        return [this, chunk](std::string_view path, const XlsxGridSource::ChunkSink& sink) -> core::Result<bool> {
            auto it = parts_.find(std::string(path));
            if (it == parts_.end()) {
                return false;
            }
            const std::string& data = it->second;
            for (size_t offset = 0; offset < data.size(); offset += chunk) {
                if (!sink(data.data() + offset, std::min(chunk, data.size() - offset))) {
                    break;
                }
            }
            return true;
        };
    }

    core::Result<core::Grid> load(const XlsxSourceOptions& options = XlsxSourceOptions()) const {
        return XlsxGridSource::loadFromParts(streamer(), options, "test workbook");
    }

    std::map<std::string, std::string> parts_;
};

// 测试完整加载并解码
TEST_F(XlsxPartsTest, LoadsFirstSheet) {
    auto grid = load();
    ASSERT_TRUE(grid.hasValue()) << grid.error().fullMessage();
    EXPECT_EQ(grid.value().rowCount(), 3u);

    auto members = de::fromGrid<std::vector<Member>>(grid.value());
    ASSERT_TRUE(members.hasValue()) << members.error().fullMessage();
    ASSERT_EQ(members.value().size(), 2u);
    EXPECT_EQ(members.value()[0].name, "Ann");
    EXPECT_EQ(members.value()[0].age, 30);
    EXPECT_EQ(members.value()[0].joined, std::optional<std::string>("2024-01-01"));
    EXPECT_EQ(members.value()[1].name, "Bob");
    EXPECT_FALSE(members.value()[1].joined.has_value());
}

// 测试日期单元格不能作为数值解码
TEST_F(XlsxPartsTest, DateCellIsNotNumber) {
    auto grid = load();
    ASSERT_TRUE(grid.hasValue());

    auto numbers = de::fromGrid<std::vector<std::tuple<std::string, int, double>>>(grid.value());
    ASSERT_TRUE(numbers.hasError());
    EXPECT_EQ(numbers.error().code, ErrorCode::NotNumber);
    EXPECT_EQ(numbers.error().context, "at C2 (row 2, column 3)");
}

// 测试没有样式表时日期按原始数值呈现
TEST_F(XlsxPartsTest, WithoutStylesDatesAreNumbers) {
    parts_.erase("xl/styles.xml");
    auto grid = load();
    ASSERT_TRUE(grid.hasValue()) << grid.error().fullMessage();
    EXPECT_EQ(grid.value().row(1)[2], core::Cell::number(45292));
}

TEST_F(XlsxPartsTest, SelectByName) {
    XlsxSourceOptions options;
    options.sheet_name = "Empty";
    auto grid = load(options);
    ASSERT_TRUE(grid.hasValue()) << grid.error().fullMessage();
    EXPECT_TRUE(grid.value().empty());

    auto decoded = de::fromGrid<std::vector<Member>>(grid.value());
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code, ErrorCode::ZeroRows);
}

// 测试工作表选择错误
TEST_F(XlsxPartsTest, SheetSelectionErrors) {
    XlsxSourceOptions by_name;
    by_name.sheet_name = "Nope";
    auto missing = load(by_name);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(missing.error().message, "sheet 'Nope' not found (available: People, Empty)");
    EXPECT_EQ(missing.error().context, "test workbook");

    XlsxSourceOptions by_index;
    by_index.sheet_index = 5;
    auto out_of_range = load(by_index);
    ASSERT_TRUE(out_of_range.hasError());
    EXPECT_EQ(out_of_range.error().message, "sheet index 5 out of range (2 sheets)");
}

// 测试缺失的必需部件
TEST_F(XlsxPartsTest, MissingParts) {
    parts_.erase("xl/worksheets/sheet2.xml");
    XlsxSourceOptions options;
    options.sheet_index = 1;
    auto no_sheet = load(options);
    ASSERT_TRUE(no_sheet.hasError());
    EXPECT_EQ(no_sheet.error().message,
              "worksheet part xl/worksheets/sheet2.xml for sheet 'Empty' missing");

    parts_.erase("xl/workbook.xml");
    auto no_workbook = load();
    ASSERT_TRUE(no_workbook.hasError());
    EXPECT_EQ(no_workbook.error().message, "not an xlsx workbook: xl/workbook.xml missing");
}

// 测试没有关系部件时使用默认路径
TEST_F(XlsxPartsTest, DefaultWorksheetPath) {
    parts_.erase("xl/_rels/workbook.xml.rels");
    auto grid = load();
    ASSERT_TRUE(grid.hasValue()) << grid.error().fullMessage();
    EXPECT_EQ(grid.value().rowCount(), 3u);
}

// 测试格式错误的工作表
TEST_F(XlsxPartsTest, MalformedWorksheet) {
    parts_["xl/worksheets/sheet1.xml"] = "<worksheet><sheetData><row></sheetData></worksheet>";
    auto grid = load();
    ASSERT_TRUE(grid.hasError());
    EXPECT_EQ(grid.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(grid.error().message.rfind("failed to parse xl/worksheets/sheet1.xml: ", 0), 0u);
}

// 测试共享字符串下标越界
TEST_F(XlsxPartsTest, BadSharedStringIndex) {
    parts_["xl/sharedStrings.xml"] = "<sst><si><t>only</t></si></sst>";
    auto grid = load();
    ASSERT_TRUE(grid.hasError());
    EXPECT_NE(grid.error().message.find("Invalid shared string index '1' at B1"), std::string::npos);
}

// 测试数据源自身的错误原样传出
TEST_F(XlsxPartsTest, StreamerErrorPropagates) {
    XlsxGridSource::PartStreamer failing =
        [](std::string_view part, const XlsxGridSource::ChunkSink&) -> core::Result<bool> {
            return core::makeError(ErrorCode::UpstreamFailure, fmt::format("failed to read {}", part), "disk");
        };
    auto grid = XlsxGridSource::loadFromParts(failing, XlsxSourceOptions(), "test workbook");
    ASSERT_TRUE(grid.hasError());
    EXPECT_EQ(grid.error().message, "failed to read xl/_rels/workbook.xml.rels");
    EXPECT_EQ(grid.error().context, "disk");
}

// 测试行数上限
TEST_F(XlsxPartsTest, MaxRows) {
    XlsxSourceOptions options;
    options.max_rows = 2;
    auto grid = load(options);
    ASSERT_TRUE(grid.hasValue());
    EXPECT_EQ(grid.value().rowCount(), 2u);
}

// 测试文件不存在
TEST(XlsxGridSourceTest, MissingFile) {
    XlsxGridSource source("/nonexistent/dir/book.xlsx");
    EXPECT_EQ(source.describe(), "xlsx file '/nonexistent/dir/book.xlsx', sheet #0");

    auto grid = source.fetch();
    ASSERT_TRUE(grid.hasError());
    EXPECT_EQ(grid.error().code, ErrorCode::UpstreamFailure);
    EXPECT_EQ(grid.error().message.rfind("cannot open '/nonexistent/dir/book.xlsx'", 0), 0u);

    XlsxSourceOptions options;
    options.sheet_name = "People";
    EXPECT_EQ(XlsxGridSource("a.xlsx", options).describe(), "xlsx file 'a.xlsx', sheet 'People'");
}

}} // namespace gridbind::source
