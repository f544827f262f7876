#include "gridbind/source/InMemoryGridSource.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace gridbind {
namespace source {

core::Result<core::Grid> InMemoryGridSource::fetch() {
    const core::SheetData* sheet = nullptr;
    if (selector_.title) {
        for (const auto& candidate : spreadsheet_.sheets) {
            if (candidate.title == *selector_.title) {
                sheet = &candidate;
                break;
            }
        }
        if (!sheet) {
            return core::makeError(core::ErrorCode::UpstreamFailure,
                                   fmt::format("sheet '{}' not found", *selector_.title),
                                   describe());
        }
    } else {
        if (selector_.index >= spreadsheet_.sheets.size()) {
            return core::makeError(core::ErrorCode::UpstreamFailure,
                                   fmt::format("sheet index {} out of range ({} sheets)",
                                               selector_.index, spreadsheet_.sheets.size()),
                                   describe());
        }
        sheet = &spreadsheet_.sheets[selector_.index];
    }

    if (sheet->data.empty()) {
        return core::makeError(core::ErrorCode::UpstreamFailure,
                               fmt::format("sheet '{}' has no grid data", sheet->title),
                               describe());
    }

    SOURCE_DEBUG("Selected sheet '{}' ({} rows)", sheet->title, sheet->data.front().rowCount());
    return sheet->data.front();
}

std::string InMemoryGridSource::describe() const {
    if (selector_.title) {
        return fmt::format("in-memory spreadsheet '{}', sheet '{}'", spreadsheet_.title, *selector_.title);
    }
    return fmt::format("in-memory spreadsheet '{}', sheet #{}", spreadsheet_.title, selector_.index);
}

}} // namespace gridbind::source
