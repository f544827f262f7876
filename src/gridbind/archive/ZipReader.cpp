#include "gridbind/archive/ZipReader.hpp"
#include "gridbind/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>

namespace gridbind {
namespace archive {

ZipReader::ZipReader(std::string path)
    : filepath_(std::move(path)) {}

ZipReader::~ZipReader() {
    cleanup();
}

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::IoFail;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_WARN("Failed to open zip file for reading: {}, error: {}", filepath_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return result == MZ_OPEN_ERROR ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_);
    buildEntryCache();
    return ZipError::Ok;
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    files.reserve(entry_cache_.size());
    for (const auto& entry : entry_cache_) {
        if (!entry.second.is_directory) {
            files.push_back(entry.first);
        }
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return entry_cache_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) const {
    content.clear();
    return streamFile(internal_path, [&content](const char* data, size_t size) {
        content.append(data, size);
        return true;
    });
}

ZipError ZipReader::streamFile(std::string_view internal_path,
                               const std::function<bool(const char*, size_t)>& callback,
                               size_t buffer_size) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }
    if (!callback || buffer_size == 0) {
        return ZipError::InvalidParameter;
    }

    if (!locateEntry(internal_path)) {
        return ZipError::FileNotFound;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry: {}", internal_path);
        return ZipError::IoFail;
    }

    std::vector<char> buffer(buffer_size);
    ZipError status = ZipError::Ok;
    size_t total = 0;

    while (true) {
        int32_t bytes_read = mz_zip_reader_entry_read(unzip_handle_, buffer.data(),
                                                      static_cast<int32_t>(buffer.size()));
        if (bytes_read < 0) {
            ARCHIVE_ERROR("Failed to read entry {}: error {}", internal_path, bytes_read);
            status = ZipError::IoFail;
            break;
        }
        if (bytes_read == 0) {
            break;
        }
        total += static_cast<size_t>(bytes_read);
        if (!callback(buffer.data(), static_cast<size_t>(bytes_read))) {
            break;  // 调用方提前结束
        }
    }

    mz_zip_reader_entry_close(unzip_handle_);
    GRIDBIND_LOG_ZIP_DEBUG("Streamed {} bytes from {}", total, internal_path);
    return status;
}

// 内部辅助方法

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_cache_.clear();
}

void ZipReader::buildEntryCache() {
    entry_cache_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                EntryInfo info;
                info.path = file_info->filename;
                info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
                info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
                info.is_directory = (info.path.back() == '/');
                entry_cache_[info.path] = info;
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    ARCHIVE_DEBUG("Built entry cache with {} entries", entry_cache_.size());
}

bool ZipReader::locateEntry(std::string_view path) const {
    std::string path_str(path);
    return mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 1) == MZ_OK;
}

}} // namespace gridbind::archive
