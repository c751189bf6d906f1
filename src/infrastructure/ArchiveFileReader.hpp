/**
 * @file ArchiveFileReader.hpp
 * @brief Reads whole archive files from disk for the command-line tools.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace scoreshelf::infrastructure {

class ArchiveFileReader {
public:
    /**
     * @brief Returns every byte of the file; an empty file gives an empty vector.
     * @throws transport::StorageError the file cannot be opened or read.
     */
    static std::vector<std::uint8_t> ReadAll(const std::string& path);
};

} // namespace scoreshelf::infrastructure
