// src/serialization_utils.cpp
#include "../include/serialization_utils.h"
#include "../include/storage_error/storage_error.h"
#include "../include/debug_utils.h"

#include <zlib.h>

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace mapstore {

uint32_t calculate_payload_checksum(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return 0;
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

uint32_t calculate_payload_checksum(const std::string& payload) {
    return calculate_payload_checksum(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

std::string ReadFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError::ioError(fs::exists(path) ? ErrorCode::IO_READ_ERROR : ErrorCode::FILE_NOT_FOUND,
                                    "open for read", path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw StorageError::ioError(ErrorCode::IO_READ_ERROR, "read", path.string());
    }
    return contents.str();
}

void WriteFileAtomically(const fs::path& path, const std::string& contents) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "create directories", path.parent_path().string())
                .withContext("system_error", ec.message());
        }
    }

    fs::path temp_path = path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "open for write", temp_path.string());
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "write", temp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        LOG_ERROR("[WriteFileAtomically] Rename of '", temp_path.string(), "' failed: ", ec.message());
        fs::remove(temp_path, ec);
        throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "rename", path.string());
    }
}

} // namespace mapstore
