/**
 * @file ArtifactCodec.cpp
 * @brief Implementation of ArtifactCodec.
 */

#include "domain/transport/ArtifactCodec.hpp"
#include <cctype>
#include <cstdint>
#include <vector>

namespace scoreshelf::domain::transport {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string describeChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    if (std::isprint(u)) {
        return std::string("'") + c + "'";
    }
    std::string hex = "0x";
    hex += kHexDigits[u >> 4];
    hex += kHexDigits[u & 0x0F];
    return hex;
}

} // namespace

RawArtifact ArtifactCodec::decode(const EncodedText& encoded) {
    if (const auto* hex = std::get_if<HexText>(&encoded)) {
        return decodeHex(hex->text);
    }
    if (const auto* b64 = std::get_if<Base64Text>(&encoded)) {
        return decodeBase64(b64->text);
    }
    const auto& native = std::get<NativeBytes>(encoded);
    if (native.bytes.empty()) {
        throw EmptyPayloadError("native byte payload is empty");
    }
    return RawArtifact(native.bytes);
}

RawArtifact ArtifactCodec::decodeHex(const std::string& text) {
    if (text.compare(0, kHexMarker.size(), kHexMarker) != 0) {
        throw DecodeError("hex payload does not start with the \\x marker");
    }

    const std::size_t digitCount = text.size() - kHexMarker.size();
    if (digitCount == 0) {
        throw EmptyPayloadError("hex payload is empty");
    }
    if (digitCount % 2 != 0) {
        throw DecodeError("hex payload has an odd digit count (" + std::to_string(digitCount) + ")");
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(digitCount / 2);
    for (std::size_t i = kHexMarker.size(); i < text.size(); i += 2) {
        const int hi = hexValue(text[i]);
        const int lo = hexValue(text[i + 1]);
        if (hi < 0 || lo < 0) {
            const std::size_t bad = hi < 0 ? i : i + 1;
            throw DecodeError("hex payload has non-hex character " + describeChar(text[bad]) +
                              " at offset " + std::to_string(bad));
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return RawArtifact(std::move(bytes));
}

RawArtifact ArtifactCodec::decodeBase64(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact.push_back(c);
        }
    }
    if (compact.empty()) {
        throw DecodeError("base64 payload is empty");
    }

    std::size_t padding = 0;
    while (padding < 2 && !compact.empty() && compact.back() == '=') {
        compact.pop_back();
        ++padding;
    }
    if (compact.empty()) {
        throw DecodeError("base64 payload holds only padding");
    }
    if (compact.size() % 4 == 1) {
        throw DecodeError("base64 payload length is impossible (" +
                          std::to_string(compact.size() + padding) + " characters)");
    }
    if (padding > 0 && (compact.size() + padding) % 4 != 0) {
        throw DecodeError("base64 payload has inconsistent padding");
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(compact.size() * 3 / 4);
    std::uint32_t accumulator = 0;
    int bits = 0;
    for (std::size_t i = 0; i < compact.size(); ++i) {
        const int value = base64Value(compact[i]);
        if (value < 0) {
            throw DecodeError("base64 payload has invalid character " + describeChar(compact[i]) +
                              " at position " + std::to_string(i));
        }
        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<std::uint8_t>((accumulator >> bits) & 0xFF));
        }
    }
    // The last character may only carry zero bits past the final byte.
    if (bits > 0 && (accumulator & ((1u << bits) - 1)) != 0) {
        throw DecodeError("base64 payload has non-zero bits after the final byte");
    }
    return RawArtifact(std::move(bytes));
}

std::string ArtifactCodec::encodeHex(const RawArtifact& artifact) {
    std::string out;
    out.reserve(kHexMarker.size() + artifact.size() * 2);
    out += kHexMarker;
    for (std::uint8_t b : artifact.bytes()) {
        out += kHexDigits[b >> 4];
        out += kHexDigits[b & 0x0F];
    }
    return out;
}

std::string ArtifactCodec::encodeBase64(const RawArtifact& artifact) {
    const auto& bytes = artifact.bytes();
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t triple = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                     (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                                     static_cast<std::uint32_t>(bytes[i + 2]);
        out += kBase64Alphabet[(triple >> 18) & 0x3F];
        out += kBase64Alphabet[(triple >> 12) & 0x3F];
        out += kBase64Alphabet[(triple >> 6) & 0x3F];
        out += kBase64Alphabet[triple & 0x3F];
    }

    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t single = static_cast<std::uint32_t>(bytes[i]) << 16;
        out += kBase64Alphabet[(single >> 18) & 0x3F];
        out += kBase64Alphabet[(single >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t pair = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                   (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out += kBase64Alphabet[(pair >> 18) & 0x3F];
        out += kBase64Alphabet[(pair >> 12) & 0x3F];
        out += kBase64Alphabet[(pair >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

} // namespace scoreshelf::domain::transport
