/**
 * @file ArtifactCodec.hpp
 * @brief Lossless conversion between RawArtifact and its textual encodings.
 */

#pragma once

#include <string>
#include "domain/transport/EncodedText.hpp"
#include "domain/transport/RawArtifact.hpp"

namespace scoreshelf::domain::transport {

/**
 * @class ArtifactCodec
 * @brief Stateless hex/base64 codec.
 *
 * Decoding throws DecodeError for malformed text and EmptyPayloadError when
 * well-formed text carries zero bytes.
 */
class ArtifactCodec {
public:
    /** @brief Dispatches on the variant tag. */
    static RawArtifact decode(const EncodedText& encoded);

    /**
     * @brief Decodes "\x"-prefixed hex. Both digit cases are accepted.
     * @throws DecodeError missing marker, odd digit count, non-hex digit.
     * @throws EmptyPayloadError marker with no digits.
     */
    static RawArtifact decodeHex(const std::string& text);

    /**
     * @brief Decodes standard base64 after stripping all whitespace.
     *
     * Trailing '=' padding is optional but must be consistent when present.
     * @throws DecodeError empty text, foreign character, misplaced padding,
     *         or a length no byte string can produce.
     */
    static RawArtifact decodeBase64(const std::string& text);

    /** @brief Canonical storage form: "\x" + lowercase hex. */
    static std::string encodeHex(const RawArtifact& artifact);

    /** @brief Padded standard base64. */
    static std::string encodeBase64(const RawArtifact& artifact);
};

} // namespace scoreshelf::domain::transport
