/**
 * @file FileSongRepository.cpp
 * @brief Implementation of FileSongRepository.
 */

#include "infrastructure/FileSongRepository.hpp"
#include "domain/transport/TransportErrors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace scoreshelf::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json recordToJson(long long songId, const domain::SongRecord& r) {
    return json{
        {"song_id", songId},
        {"song_title", r.songTitle},
        {"composer_first_name", r.composerFirstName},
        {"composer_last_name", r.composerLastName},
        {"skill_level_name", r.skillLevelName},
        {"file_name", r.fileName},
        {"song_mxl", r.songMxl},
        {"updated_datetime", r.updatedAt}
    };
}

domain::SongRecord recordFromJson(const json& j) {
    domain::SongRecord r;
    r.songTitle = j.at("song_title").get<std::string>();
    r.composerFirstName = j.at("composer_first_name").get<std::string>();
    r.composerLastName = j.at("composer_last_name").get<std::string>();
    r.skillLevelName = j.at("skill_level_name").get<std::string>();
    r.fileName = j.at("file_name").get<std::string>();
    r.songMxl = j.at("song_mxl").get<std::string>();
    r.updatedAt = j.value("updated_datetime", std::string());
    return r;
}

} // namespace

FileSongRepository::FileSongRepository(std::string storePath, std::shared_ptr<PersistenceService> persistence)
    : m_storePath(std::move(storePath)), m_persistence(std::move(persistence)) {
    load();
}

void FileSongRepository::load() {
    if (!fs::exists(m_storePath)) {
        return;
    }

    std::ifstream in(m_storePath, std::ios::binary);
    if (!in) {
        throw domain::transport::StorageError("cannot open song store: " + m_storePath);
    }

    try {
        json doc;
        in >> doc;
        for (const auto& row : doc.at("songs")) {
            m_table.restore(row.at("song_id").get<long long>(), recordFromJson(row));
        }
        m_table.reserveIdsBelow(doc.value("next_id", 1LL));
    } catch (const json::exception& e) {
        throw domain::transport::StorageError("song store " + m_storePath + " is malformed: " + e.what());
    }
    std::cout << "[FileSongRepository] Loaded " << m_table.rows().size() << " songs from " << m_storePath << std::endl;
}

std::string FileSongRepository::serializeLocked() const {
    json songs = json::array();
    for (const auto& [id, record] : m_table.rows()) {
        songs.push_back(recordToJson(id, record));
    }
    json doc = {{"next_id", m_table.nextId()}, {"songs", songs}};
    return doc.dump(2);
}

void FileSongRepository::persistLocked(SongTable previous) {
    // Called under the lock so snapshots reach the writer in table order and
    // the reported outcome belongs to this snapshot.
    m_persistence->saveSnapshotAsync(m_storePath, serializeLocked());
    m_persistence->flush();
    if (auto error = m_persistence->lastWriteError(m_storePath)) {
        m_table = std::move(previous);
        throw domain::transport::StorageError("song store write failed: " + *error);
    }
}

long long FileSongRepository::upsertSong(const domain::SongRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    SongTable previous = m_table;
    long long songId = m_table.upsert(record);
    persistLocked(std::move(previous));
    return songId;
}

bool FileSongRepository::replaceSongMxl(long long songId, const std::string& canonicalHex,
                                        const std::string& updatedAt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    SongTable previous = m_table;
    if (!m_table.replaceMxl(songId, canonicalHex, updatedAt)) {
        return false;
    }
    persistLocked(std::move(previous));
    return true;
}

std::optional<domain::StoredSongArtifact> FileSongRepository::findSongArtifact(long long songId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto record = m_table.find(songId);
    if (!record) {
        return std::nullopt;
    }
    return domain::StoredSongArtifact{json(record->songMxl), record->songTitle};
}

void FileSongRepository::flush() {
    m_persistence->flush();
}

std::size_t FileSongRepository::size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_table.rows().size();
}

} // namespace scoreshelf::infrastructure
