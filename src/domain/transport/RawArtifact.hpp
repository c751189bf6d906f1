/**
 * @file RawArtifact.hpp
 * @brief Value Object holding the exact binary content of one score archive.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "domain/transport/TransportErrors.hpp"

namespace scoreshelf::domain::transport {

/**
 * @class RawArtifact
 * @brief Owned, immutable byte sequence.
 *
 * Invariant: never empty. An empty archive can never be a valid ZIP, so an
 * empty buffer means a null or missing value upstream.
 */
class RawArtifact {
public:
    explicit RawArtifact(std::vector<std::uint8_t> bytes)
        : m_bytes(std::move(bytes)) {
        if (m_bytes.empty()) {
            throw EmptyPayloadError("artifact payload is empty");
        }
    }

    const std::vector<std::uint8_t>& bytes() const { return m_bytes; }
    std::size_t size() const { return m_bytes.size(); }

    /** @brief Copies the bytes into a std::string for transport bodies. */
    std::string toBinaryString() const {
        return std::string(reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size());
    }

    bool operator==(const RawArtifact& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const RawArtifact& other) const { return !(*this == other); }

private:
    std::vector<std::uint8_t> m_bytes;
};

} // namespace scoreshelf::domain::transport
