/**
 * @file EncodedText.hpp
 * @brief The textual or near-binary forms an artifact takes at a boundary.
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace scoreshelf::domain::transport {

/** @brief Marker prefixed to every hex-escaped payload ("\x"). */
inline const std::string kHexMarker = "\\x";

struct HexText {
    std::string text; ///< Marker followed by hex digits.
};

struct Base64Text {
    std::string text; ///< Standard alphabet, whitespace allowed.
};

struct NativeBytes {
    std::vector<std::uint8_t> bytes;
};

/**
 * @brief Tagged encoding of one artifact.
 *
 * The tag comes from sniffing the value (see EncodingSniffer), never from a
 * field supplied alongside it.
 */
using EncodedText = std::variant<HexText, Base64Text, NativeBytes>;

inline std::string EncodingToString(const EncodedText& encoded) {
    if (std::holds_alternative<HexText>(encoded)) return "hex";
    if (std::holds_alternative<Base64Text>(encoded)) return "base64";
    return "native";
}

} // namespace scoreshelf::domain::transport
