/**
 * @file EncodingSniffer.cpp
 * @brief Implementation of EncodingSniffer.
 */

#include "domain/transport/EncodingSniffer.hpp"
#include "domain/transport/ArtifactCodec.hpp"
#include "domain/transport/TransportErrors.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace scoreshelf::domain::transport {

using json = nlohmann::json;

namespace {

std::uint8_t toByte(const json& element, std::size_t index) {
    bool inRange = false;
    std::uint8_t value = 0;
    if (element.is_number_unsigned()) {
        const auto v = element.get<std::uint64_t>();
        inRange = v <= 0xFF;
        value = static_cast<std::uint8_t>(v);
    } else {
        const auto v = element.get<std::int64_t>();
        inRange = v >= 0 && v <= 0xFF;
        value = static_cast<std::uint8_t>(v);
    }
    if (!inRange) {
        throw DecodeError("stored byte array element " + std::to_string(index) +
                          " is outside 0..255: " + element.dump());
    }
    return value;
}

} // namespace

EncodedText EncodingSniffer::classify(const json& value) {
    if (value.is_null()) {
        throw EmptyPayloadError("stored artifact is null");
    }

    if (value.is_binary()) {
        const auto& binary = value.get_binary();
        return NativeBytes{std::vector<std::uint8_t>(binary.begin(), binary.end())};
    }

    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.compare(0, kHexMarker.size(), kHexMarker) == 0) {
            return HexText{text};
        }
        return Base64Text{text};
    }

    if (value.is_array()) {
        std::vector<std::uint8_t> bytes;
        bytes.reserve(value.size());
        std::size_t index = 0;
        for (const auto& element : value) {
            if (!element.is_number_integer()) {
                throw UnsupportedEncodingError("Unsupported stored artifact array element type: " +
                                               std::string(element.type_name()));
            }
            bytes.push_back(toByte(element, index++));
        }
        return NativeBytes{std::move(bytes)};
    }

    throw UnsupportedEncodingError("Unsupported stored artifact type: " + std::string(value.type_name()));
}

RawArtifact EncodingSniffer::decode(const json& value) {
    return ArtifactCodec::decode(classify(value));
}

} // namespace scoreshelf::domain::transport
