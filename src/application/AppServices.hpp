/**
 * @file AppServices.hpp
 * @brief Container for the services the entry point constructs and owns.
 */

#pragma once

#include <memory>
#include "application/SongCatalogService.hpp"
#include "domain/SongRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace scoreshelf::application {

struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService; ///< Null for the memory backend.
    std::shared_ptr<domain::SongRepository> songRepository;
    std::shared_ptr<SongCatalogService> catalogService;
};

} // namespace scoreshelf::application
