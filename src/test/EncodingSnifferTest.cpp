#include <cassert>
#include <iostream>
#include <nlohmann/json.hpp>

#include "domain/transport/ArtifactCodec.hpp"
#include "domain/transport/EncodingSniffer.hpp"
#include "domain/transport/TransportErrors.hpp"
#include "test/TestSupport.hpp"

using namespace scoreshelf::domain::transport;
using namespace scoreshelf::test;
using json = nlohmann::json;

namespace {

void testClassification() {
    assert(std::holds_alternative<HexText>(EncodingSniffer::classify(json("\\x504b0304"))));
    assert(std::holds_alternative<Base64Text>(EncodingSniffer::classify(json("UEsDBA=="))));
    assert(std::holds_alternative<NativeBytes>(EncodingSniffer::classify(json::binary(Bytes{0x50, 0x4B}))));
    assert(std::holds_alternative<NativeBytes>(EncodingSniffer::classify(json::array({80, 75, 3, 4}))));
    assert(EncodingToString(EncodingSniffer::classify(json("\\x00"))) == "hex");
    std::cout << "[PASS] shape classification" << std::endl;
}

void testSameBytesFromEveryShape() {
    const Bytes bytes = ZipWithComment(33, 4);
    RawArtifact expected(bytes);

    json hexValue = ArtifactCodec::encodeHex(expected);
    json base64Value = ArtifactCodec::encodeBase64(expected);
    json binaryValue = json::binary(bytes);
    json arrayValue = bytes;

    assert(EncodingSniffer::decode(hexValue) == expected);
    assert(EncodingSniffer::decode(base64Value) == expected);
    assert(EncodingSniffer::decode(binaryValue) == expected);
    assert(EncodingSniffer::decode(arrayValue) == expected);
    std::cout << "[PASS] sniffing determinism" << std::endl;
}

void testNullAndEmptyValues() {
    assert(Throws<EmptyPayloadError>([] { EncodingSniffer::decode(json(nullptr)); }));
    assert(Throws<EmptyPayloadError>([] { EncodingSniffer::decode(json::array()); }));
    assert(Throws<EmptyPayloadError>([] { EncodingSniffer::decode(json::binary(Bytes{})); }));
    assert(Throws<EmptyPayloadError>([] { EncodingSniffer::decode(json("\\x")); }));
    assert(Throws<DecodeError>([] { EncodingSniffer::decode(json("")); }));
    std::cout << "[PASS] null and empty values" << std::endl;
}

void testUnsupportedShapes() {
    assert(Throws<UnsupportedEncodingError>([] { EncodingSniffer::classify(json::object({{"data", "x"}})); }));
    assert(Throws<UnsupportedEncodingError>([] { EncodingSniffer::classify(json(42)); }));
    assert(Throws<UnsupportedEncodingError>([] { EncodingSniffer::classify(json(true)); }));
    assert(Throws<UnsupportedEncodingError>([] { EncodingSniffer::classify(json::array({80, "K"})); }));
    assert(Throws<UnsupportedEncodingError>([] { EncodingSniffer::classify(json::array({80.5})); }));
    std::cout << "[PASS] unsupported shapes" << std::endl;
}

void testByteRangeEnforced() {
    assert(Throws<DecodeError>([] { EncodingSniffer::classify(json::array({80, 256})); }));
    assert(Throws<DecodeError>([] { EncodingSniffer::classify(json::array({-1, 75})); }));
    auto edge = EncodingSniffer::decode(json::array({0, 255}));
    assert((edge.bytes() == Bytes{0x00, 0xFF}));
    std::cout << "[PASS] byte range" << std::endl;
}

void testMalformedStoredText() {
    assert(Throws<DecodeError>([] { EncodingSniffer::decode(json("\\x50f")); }));
    assert(Throws<DecodeError>([] { EncodingSniffer::decode(json("not base64!")); }));
    std::cout << "[PASS] malformed stored text" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting EncodingSniffer tests..." << std::endl;
    testClassification();
    testSameBytesFromEveryShape();
    testNullAndEmptyValues();
    testUnsupportedShapes();
    testByteRangeEnforced();
    testMalformedStoredText();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
