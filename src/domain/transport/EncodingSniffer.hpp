/**
 * @file EncodingSniffer.hpp
 * @brief Classifies an opaque storage value into an EncodedText variant.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/transport/EncodedText.hpp"
#include "domain/transport/RawArtifact.hpp"

namespace scoreshelf::domain::transport {

/**
 * @class EncodingSniffer
 * @brief Fixed-priority dispatch over the shapes a storage read can return.
 *
 * Priority: null (error) -> binary -> "\x" string -> other string (base64)
 * -> integer array -> anything else (UnsupportedEncodingError).
 */
class EncodingSniffer {
public:
    /**
     * @throws EmptyPayloadError the value is null.
     * @throws DecodeError an array element is outside 0..255.
     * @throws UnsupportedEncodingError no rule matches.
     */
    static EncodedText classify(const nlohmann::json& value);

    /** @brief classify() followed by ArtifactCodec::decode(). */
    static RawArtifact decode(const nlohmann::json& value);
};

} // namespace scoreshelf::domain::transport
