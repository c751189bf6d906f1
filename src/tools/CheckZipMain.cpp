/**
 * @file CheckZipMain.cpp
 * @brief scoreshelf_check_zip: prints the structural report of an .mxl file.
 *
 * Exit codes: 0 complete archive, 2 incomplete or not a ZIP, 1 usage or I/O error.
 */

#include <iostream>
#include <string>

#include "application/ArchiveDiagnostics.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "infrastructure/ArchiveFileReader.hpp"

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: scoreshelf_check_zip <path-to-file.mxl>" << std::endl;
        return 1;
    }

    const std::string path = argv[1];
    try {
        auto bytes = scoreshelf::infrastructure::ArchiveFileReader::ReadAll(path);
        auto check = scoreshelf::application::ArchiveDiagnostics::Check(path, bytes);
        std::cout << scoreshelf::application::ArchiveDiagnostics::ToJson(check).dump(2) << std::endl;
        return (check.hasZipMagic && check.integrity.ok) ? 0 : 2;
    } catch (const scoreshelf::domain::transport::StorageError& e) {
        std::cerr << "[scoreshelf_check_zip] " << e.what() << std::endl;
        return 1;
    }
}
