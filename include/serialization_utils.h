// include/serialization_utils.h
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace mapstore {

// zlib CRC-32 of a payload.
uint32_t calculate_payload_checksum(const uint8_t* data, size_t len);
uint32_t calculate_payload_checksum(const std::string& payload);

/**
 * @brief Reads a whole file.
 * @throws StorageError FILE_NOT_FOUND or IO_READ_ERROR.
 */
std::string ReadFileToString(const std::filesystem::path& path);

/**
 * @brief Replaces a file's contents by writing a sibling temp file and
 * renaming it over the target, so readers never see a partial file.
 * @throws StorageError IO_WRITE_ERROR.
 */
void WriteFileAtomically(const std::filesystem::path& path, const std::string& contents);

} // namespace mapstore
