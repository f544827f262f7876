#pragma once

#include "gridbind/source/GridSource.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace gridbind {
namespace source {

/**
 * @brief 工作表选择：按标题或按索引，默认第一个工作表
 */
struct SheetSelector {
    std::optional<std::string> title;
    size_t index = 0;

    static SheetSelector byTitle(std::string name) {
        SheetSelector selector;
        selector.title = std::move(name);
        return selector;
    }

    static SheetSelector byIndex(size_t i) {
        SheetSelector selector;
        selector.index = i;
        return selector;
    }
};

/**
 * @brief 包装内存中的 Spreadsheet，返回选中工作表的第一个网格
 */
class InMemoryGridSource : public GridSource {
public:
    explicit InMemoryGridSource(core::Spreadsheet spreadsheet,
                                SheetSelector selector = SheetSelector())
        : spreadsheet_(std::move(spreadsheet)), selector_(std::move(selector)) {}

    core::Result<core::Grid> fetch() override;
    std::string describe() const override;

    const core::Spreadsheet& spreadsheet() const { return spreadsheet_; }

private:
    core::Spreadsheet spreadsheet_;
    SheetSelector selector_;
};

}} // namespace gridbind::source
