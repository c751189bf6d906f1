/**
 * @file ArchiveFileReader.cpp
 * @brief Implementation of ArchiveFileReader.
 */

#include "infrastructure/ArchiveFileReader.hpp"
#include "domain/transport/TransportErrors.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace scoreshelf::infrastructure {

std::vector<std::uint8_t> ArchiveFileReader::ReadAll(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw domain::transport::StorageError("not a file: " + path);
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw domain::transport::StorageError("cannot open " + path);
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw domain::transport::StorageError("read failed: " + path);
    }
    return bytes;
}

} // namespace scoreshelf::infrastructure
