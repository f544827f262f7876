#include "gridbind/source/XlsxGridSource.hpp"
#include "gridbind/archive/ZipReader.hpp"
#include "gridbind/reader/GridWorksheetParser.hpp"
#include "gridbind/reader/RelationshipsParser.hpp"
#include "gridbind/reader/SharedStringsParser.hpp"
#include "gridbind/reader/StylesParser.hpp"
#include "gridbind/reader/WorkbookParser.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace gridbind {
namespace source {

namespace {

constexpr std::string_view kWorkbookPart = "xl/workbook.xml";
constexpr std::string_view kWorkbookRelsPart = "xl/_rels/workbook.xml.rels";
constexpr std::string_view kSharedStringsPart = "xl/sharedStrings.xml";
constexpr std::string_view kStylesPart = "xl/styles.xml";

core::Error upstream(const std::string& message, const std::string& description) {
    return core::makeError(core::ErrorCode::UpstreamFailure, message, description);
}

/**
 * @brief 流式解析一个部件
 * @return 部件不存在时返回 false
 */
core::Result<bool> parsePart(const XlsxGridSource::PartStreamer& streamer,
                             std::string_view part_path,
                             reader::BaseSAXParser& parser,
                             const std::string& description) {
    if (!parser.beginParsing()) {
        return upstream(fmt::format("failed to start parsing {}: {}", part_path, parser.getErrorMessage()),
                        description);
    }

    auto found = streamer(part_path, [&parser](const char* data, size_t size) {
        return parser.feedData(data, size);
    });
    if (found.hasError()) {
        return std::move(found).error();
    }
    if (!found.value()) {
        return false;
    }

    if (!parser.endParsing()) {
        return upstream(fmt::format("failed to parse {}: {}", part_path, parser.getErrorMessage()),
                        description);
    }
    return true;
}

/**
 * @brief 读取工作簿结构（关系 + 工作表列表）
 */
core::VoidResult loadWorkbook(const XlsxGridSource::PartStreamer& streamer,
                              reader::WorkbookParser& workbook,
                              const std::string& description) {
    reader::RelationshipsParser rels;
    auto rels_found = parsePart(streamer, kWorkbookRelsPart, rels, description);
    if (rels_found.hasError()) {
        return std::move(rels_found).error();
    }
    if (rels_found.value()) {
        workbook.setRelationships(rels.targetMap());
    } else {
        SOURCE_DEBUG("{} missing, using default worksheet paths", kWorkbookRelsPart);
    }

    workbook.reset();
    auto workbook_found = parsePart(streamer, kWorkbookPart, workbook, description);
    if (workbook_found.hasError()) {
        return std::move(workbook_found).error();
    }
    if (!workbook_found.value()) {
        return upstream(fmt::format("not an xlsx workbook: {} missing", kWorkbookPart), description);
    }
    return core::success();
}

core::Result<const reader::WorksheetInfo*> selectSheet(const std::vector<reader::WorksheetInfo>& sheets,
                                                       const XlsxSourceOptions& options,
                                                       const std::string& description) {
    if (options.sheet_name) {
        for (const auto& sheet : sheets) {
            if (sheet.name == *options.sheet_name) {
                return &sheet;
            }
        }
        std::string available;
        for (const auto& sheet : sheets) {
            available += available.empty() ? sheet.name : ", " + sheet.name;
        }
        return upstream(fmt::format("sheet '{}' not found (available: {})", *options.sheet_name, available),
                        description);
    }
    if (options.sheet_index >= sheets.size()) {
        return upstream(fmt::format("sheet index {} out of range ({} sheets)", options.sheet_index, sheets.size()),
                        description);
    }
    return &sheets[options.sheet_index];
}

XlsxGridSource::PartStreamer zipStreamer(const archive::ZipReader& zip, const std::string& description) {
    return [&zip, description](std::string_view part_path, const XlsxGridSource::ChunkSink& sink) -> core::Result<bool> {
        archive::ZipError status = zip.streamFile(part_path, sink);
        if (status == archive::ZipError::FileNotFound) {
            return false;
        }
        if (archive::isError(status)) {
            return upstream(fmt::format("failed to read {}: {}", part_path, archive::toString(status)), description);
        }
        return true;
    };
}

} // namespace

XlsxGridSource::XlsxGridSource(std::string path, XlsxSourceOptions options)
    : path_(std::move(path)), options_(std::move(options)) {}

std::string XlsxGridSource::describe() const {
    if (options_.sheet_name) {
        return fmt::format("xlsx file '{}', sheet '{}'", path_, *options_.sheet_name);
    }
    return fmt::format("xlsx file '{}', sheet #{}", path_, options_.sheet_index);
}

core::Result<core::Grid> XlsxGridSource::fetch() {
    const std::string description = describe();

    archive::ZipReader zip(path_);
    archive::ZipError status = zip.open();
    if (archive::isError(status)) {
        return upstream(fmt::format("cannot open '{}': {}", path_, archive::toString(status)), description);
    }

    SOURCE_DEBUG("Opened {}", description);
    return loadFromParts(zipStreamer(zip, description), options_, description);
}

core::Result<std::vector<std::string>> XlsxGridSource::sheetNames() const {
    const std::string description = describe();

    archive::ZipReader zip(path_);
    archive::ZipError status = zip.open();
    if (archive::isError(status)) {
        return upstream(fmt::format("cannot open '{}': {}", path_, archive::toString(status)), description);
    }

    reader::WorkbookParser workbook;
    GRIDBIND_TRY(loadWorkbook(zipStreamer(zip, description), workbook, description));

    std::vector<std::string> names;
    for (const auto& sheet : workbook.getWorksheets()) {
        names.push_back(sheet.name);
    }
    return names;
}

core::Result<core::Grid> XlsxGridSource::loadFromParts(const PartStreamer& streamer,
                                                       const XlsxSourceOptions& options,
                                                       const std::string& description) {
    if (!streamer) {
        return upstream("no part streamer", description);
    }

    reader::WorkbookParser workbook;
    GRIDBIND_TRY(loadWorkbook(streamer, workbook, description));

    auto selected = selectSheet(workbook.getWorksheets(), options, description);
    if (selected.hasError()) {
        return std::move(selected).error();
    }
    const reader::WorksheetInfo& sheet = *selected.value();

    // 共享字符串与样式表都是可选部件
    reader::SharedStringsParser shared_strings;
    auto sst_found = parsePart(streamer, kSharedStringsPart, shared_strings, description);
    if (sst_found.hasError()) {
        return std::move(sst_found).error();
    }

    reader::StylesParser styles;
    auto styles_found = parsePart(streamer, kStylesPart, styles, description);
    if (styles_found.hasError()) {
        return std::move(styles_found).error();
    }

    reader::GridWorksheetParser worksheet;
    worksheet.configure(sst_found.value() ? &shared_strings : nullptr,
                        styles_found.value() ? &styles : nullptr,
                        workbook.isDate1904(),
                        options.max_rows);
    worksheet.reset();

    auto sheet_found = parsePart(streamer, sheet.worksheet_path, worksheet, description);
    if (sheet_found.hasError()) {
        return std::move(sheet_found).error();
    }
    if (!sheet_found.value()) {
        return upstream(fmt::format("worksheet part {} for sheet '{}' missing", sheet.worksheet_path, sheet.name),
                        description);
    }

    core::Grid grid = worksheet.takeGrid();
    SOURCE_INFO("Loaded sheet '{}': {} rows, {} cells", sheet.name, grid.rowCount(), worksheet.getCellsProcessed());
    return grid;
}

}} // namespace gridbind::source
