/**
 * @file decode_xlsx_example.cpp
 * @brief GridBind 解码示例
 *
 * 把 xlsx 文件的一个工作表解码为未类型化的记录并逐行打印。
 * 用法：decode_xlsx_example <file.xlsx> [sheet]
 */

#include "gridbind/GridBind.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <iostream>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "用法: " << argv[0] << " <file.xlsx> [sheet]" << std::endl;
        return 1;
    }

    gridbind::LoggerConfig log_config;
    log_config.level = gridbind::Logger::Level::INFO;
    if (!gridbind::initialize(log_config)) {
        std::cerr << "无法初始化 GridBind" << std::endl;
        return 1;
    }

    gridbind::source::XlsxSourceOptions options;
    if (argc > 2) {
        options.sheet_name = argv[2];
    }
    gridbind::source::XlsxGridSource source(argv[1], options);

    auto names = source.sheetNames();
    if (names.hasValue()) {
        std::cout << "发现 " << names.value().size() << " 个工作表:" << std::endl;
        for (const auto& name : names.value()) {
            std::cout << "  - " << name << std::endl;
        }
    }

    int exit_code = 0;
    try {
        auto records = gridbind::de::fromSourceOrThrow<std::vector<gridbind::serde::Value>>(source);
        EXAMPLE_INFO("Decoded {} records from {}", records.size(), source.describe());

        for (size_t i = 0; i < records.size(); ++i) {
            std::cout << (i + 1) << ": " << records[i].toString() << std::endl;
        }
    } catch (const gridbind::core::UpstreamException& e) {
        EXAMPLE_ERROR("Cannot read {}: {}", e.getSource(), e.what());
        exit_code = 2;
    } catch (const gridbind::core::GridBindException& e) {
        EXAMPLE_ERROR("Decode failed: {}", e.getDetailedMessage());
        exit_code = 3;
    }

    gridbind::cleanup();
    return exit_code;
}
