#include <cassert>
#include <iostream>

#include "domain/transport/TransportErrors.hpp"
#include "domain/transport/ZipIntegrityVerifier.hpp"
#include "test/TestSupport.hpp"

using namespace scoreshelf::domain::transport;
using namespace scoreshelf::test;

namespace {

void testMagicSignatures() {
    assert(ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x03, 0x04}));
    assert(ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x05, 0x06, 0x00}));
    assert(ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x07, 0x08}));

    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x03}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{'G', 'I', 'F', '8', '9', 'a'}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x01, 0x02}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4C, 0x03, 0x04}));
    // Mixed third/fourth bytes are not signatures.
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x03, 0x06}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x05, 0x04}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x07, 0x04}));
    assert(!ZipIntegrityVerifier::hasZipMagic(Bytes{0x50, 0x4B, 0x03, 0x08}));

    assert(Throws<NotAZipArchiveError>([] {
        ZipIntegrityVerifier::requireZipMagic(RawArtifact(Bytes{'%', 'P', 'D', 'F', '-'}));
    }));
    try {
        ZipIntegrityVerifier::requireZipMagic(RawArtifact(Bytes{'G', 'I', 'F', '8'}));
        assert(false);
    } catch (const NotAZipArchiveError& e) {
        assert(e.code() == "payload_not_mxl_zip");
    }
    std::cout << "[PASS] magic-number check" << std::endl;
}

void testExactArchive() {
    auto bytes = ZipWithComment(100, 12);
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(report.ok);
    assert(report.status == ZipCompleteness::Exact);
    assert(report.eocdOffset && *report.eocdOffset == 104);
    assert(report.commentLength == 12);
    assert(report.missingBytes == 0);
    assert(report.trailingBytes == 0);

    auto empty = ZipIntegrityVerifier::inspect(MinimalEmptyZip());
    assert(empty.ok && empty.status == ZipCompleteness::Exact);
    assert(empty.eocdOffset && *empty.eocdOffset == 0);
    std::cout << "[PASS] EOCD exact case" << std::endl;
}

void testTruncatedArchive() {
    const std::uint16_t commentLength = 40;
    for (std::size_t k : {1u, 7u, 39u}) {
        auto bytes = ZipWithComment(64, commentLength);
        bytes.resize(bytes.size() - k);
        auto report = ZipIntegrityVerifier::inspect(bytes);
        assert(!report.ok);
        assert(report.status == ZipCompleteness::Truncated);
        assert(report.missingBytes == k);
        assert(report.commentLength == commentLength);
    }
    std::cout << "[PASS] EOCD truncated case" << std::endl;
}

void testTruncatedInsideEocdHeader() {
    auto bytes = ZipWithComment(10, 0);
    bytes.resize(bytes.size() - 5);
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(!report.ok);
    assert(report.status == ZipCompleteness::Truncated);
    assert(report.eocdOffset && *report.eocdOffset == 14);
    assert(report.missingBytes == 5);
    std::cout << "[PASS] EOCD header cut short" << std::endl;
}

void testTrailingBytesStillAccepted() {
    auto bytes = ZipWithComment(20, 3);
    bytes.push_back(0x00);
    bytes.push_back(0x01);
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(report.ok);
    assert(report.status == ZipCompleteness::TrailingBytes);
    assert(report.trailingBytes == 2);
    assert(report.missingBytes == 0);
    std::cout << "[PASS] trailing bytes distinguishable from exact" << std::endl;
}

void testMissingEocd() {
    Bytes bytes = {0x50, 0x4B, 0x03, 0x04};
    bytes.resize(4096, 0x11);
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(!report.ok);
    assert(report.status == ZipCompleteness::MissingEocd);
    assert(!report.eocdOffset);
    std::cout << "[PASS] no EOCD in window" << std::endl;
}

void testSignatureBeforeWindowIsIgnored() {
    // Signature sits at offset 4; 65557 filler bytes push it out of the window.
    Bytes bytes = MinimalEmptyZip();
    Bytes prefix = {0x50, 0x4B, 0x03, 0x04};
    bytes.insert(bytes.begin(), prefix.begin(), prefix.end());
    bytes.resize(bytes.size() + ZipIntegrityVerifier::kEocdFixedSize + ZipIntegrityVerifier::kMaxCommentLength, 0x20);
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(report.status == ZipCompleteness::MissingEocd);
    assert(!report.eocdOffset);
    std::cout << "[PASS] search window lower bound" << std::endl;
}

void testMaximumCommentIsFound() {
    auto bytes = ZipWithComment(5000, 65535);
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(report.ok);
    assert(report.status == ZipCompleteness::Exact);
    assert(*report.eocdOffset == 5004);
    std::cout << "[PASS] EOCD with maximum comment" << std::endl;
}

void testForwardScanTakesFirstSignature() {
    // A spurious signature in the body wins over the real record.
    Bytes bytes = {0x50, 0x4B, 0x03, 0x04, 0x50, 0x4B, 0x05, 0x06};
    bytes.resize(40, 0x00);
    auto tail = ZipWithComment(0, 0);
    bytes.insert(bytes.end(), tail.begin() + 4, tail.end());
    auto report = ZipIntegrityVerifier::inspect(bytes);
    assert(report.eocdOffset && *report.eocdOffset == 4);
    assert(report.status == ZipCompleteness::TrailingBytes);
    std::cout << "[PASS] forward scan picks earliest candidate" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ZipIntegrityVerifier tests..." << std::endl;
    testMagicSignatures();
    testExactArchive();
    testTruncatedArchive();
    testTruncatedInsideEocdHeader();
    testTrailingBytesStillAccepted();
    testMissingEocd();
    testSignatureBeforeWindowIsIgnored();
    testMaximumCommentIsFound();
    testForwardScanTakesFirstSignature();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
