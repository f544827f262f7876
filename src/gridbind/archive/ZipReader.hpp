#pragma once

#include "gridbind/archive/ZipError.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gridbind {
namespace archive {

/**
 * @brief ZIP读取器（基于 minizip-ng）
 *
 * 特性：
 * - 条目信息缓存
 * - 整体提取或流式读取
 */
class ZipReader {
public:
    // ========== 条目信息结构 ==========
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        bool is_directory = false;
    };

    // ========== 构造/析构 ==========
    explicit ZipReader(std::string path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    // ========== 文件操作 ==========

    /**
     * 打开ZIP文件进行读取
     * @return 文件不存在或不是ZIP时返回错误
     */
    ZipError open();

    void close();

    bool isOpen() const { return is_open_; }

    // ========== 条目查询 ==========

    std::vector<std::string> listFiles() const;

    /**
     * @return ZipError::Ok 表示条目存在
     */
    ZipError fileExists(std::string_view internal_path) const;

    // ========== 读取操作 ==========

    /**
     * 提取条目到字符串
     */
    ZipError extractFile(std::string_view internal_path, std::string& content) const;

    /**
     * 流式读取条目
     * @param callback 数据回调 (data, size) -> 是否继续；返回 false 视为正常结束
     */
    ZipError streamFile(std::string_view internal_path,
                        const std::function<bool(const char*, size_t)>& callback,
                        size_t buffer_size = 65536) const;

    const std::string& getPath() const { return filepath_; }

private:
    void* unzip_handle_ = nullptr;
    std::string filepath_;
    bool is_open_ = false;
    mutable std::mutex mutex_;

    // 条目信息缓存
    std::unordered_map<std::string, EntryInfo> entry_cache_;

    void cleanup();
    void buildEntryCache();
    bool locateEntry(std::string_view path) const;
};

}} // namespace gridbind::archive
