/**
 * @file TransportErrors.hpp
 * @brief Exception taxonomy for the artifact transport path.
 *
 * Every error carries a stable machine-readable code. The HTTP boundary maps
 * codes to status lines; nothing below it knows about HTTP.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace scoreshelf::domain::transport {

/**
 * @class TransportError
 * @brief Root of all request-scoped failures raised while moving an artifact.
 */
class TransportError : public std::runtime_error {
public:
    TransportError(std::string code, const std::string& message)
        : std::runtime_error(message), m_code(std::move(code)) {}

    /** @brief Stable identifier, e.g. "payload_not_mxl_zip". */
    const std::string& code() const noexcept { return m_code; }

private:
    std::string m_code;
};

/** @brief Malformed hex or base64 text. */
class DecodeError : public TransportError {
public:
    explicit DecodeError(const std::string& message)
        : TransportError("decode_error", message) {}

protected:
    DecodeError(std::string code, const std::string& message)
        : TransportError(std::move(code), message) {}
};

/** @brief Client-supplied base64 that could not be decoded. */
class InvalidBase64Error : public DecodeError {
public:
    explicit InvalidBase64Error(const std::string& message)
        : DecodeError("invalid_base64", message) {}
};

/** @brief Stored value was null or decoded to zero bytes. */
class EmptyPayloadError : public TransportError {
public:
    explicit EmptyPayloadError(const std::string& message)
        : TransportError("empty_payload", message) {}
};

/** @brief Leading bytes are not a ZIP signature. */
class NotAZipArchiveError : public TransportError {
public:
    explicit NotAZipArchiveError(const std::string& message)
        : TransportError("payload_not_mxl_zip", message) {}
};

/** @brief Storage returned a value shape no sniffing rule recognizes. */
class UnsupportedEncodingError : public TransportError {
public:
    explicit UnsupportedEncodingError(const std::string& message)
        : TransportError("unsupported_encoding", message) {}
};

/** @brief Decoded artifact exceeds the configured size ceiling. */
class PayloadTooLargeError : public TransportError {
public:
    explicit PayloadTooLargeError(const std::string& message)
        : TransportError("payload_too_large", message) {}
};

/** @brief Request envelope is malformed (bad JSON, missing fields, bad id). */
class RequestError : public TransportError {
public:
    explicit RequestError(const std::string& message)
        : TransportError("bad_request", message) {}
};

/** @brief Another song already uses the same title/composer/level triple. */
class DuplicateSongError : public TransportError {
public:
    explicit DuplicateSongError(const std::string& message)
        : TransportError("duplicate_song_metadata", message) {}
};

/** @brief The storage collaborator failed to read or write. */
class StorageError : public TransportError {
public:
    explicit StorageError(const std::string& message)
        : TransportError("storage_error", message) {}
};

} // namespace scoreshelf::domain::transport
