#include "GridBind.hpp"
#include <iostream>

namespace gridbind {

GRIDBIND_API bool initialize(const LoggerConfig& config) {
    try {
        Logger::getInstance().initialize(config);
        GRIDBIND_LOG_INFO("GridBind library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        if (config.enable_console) {
            std::cerr << "Failed to initialize GridBind: " << e.what() << std::endl;
        }
        return false;
    }
}

GRIDBIND_API void cleanup() {
    GRIDBIND_LOG_INFO("GridBind library cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace gridbind
