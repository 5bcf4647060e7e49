#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace CapBridge {
namespace CryptoHelpers {
    // Digests, raw binary output
    std::vector<uint8_t> md5(const std::vector<uint8_t>& data);
    std::vector<uint8_t> sha1(const std::vector<uint8_t>& data);
    std::vector<uint8_t> sha2_256(const std::vector<uint8_t>& data);
    std::vector<uint8_t> sha2_512(const std::vector<uint8_t>& data);
    std::vector<uint8_t> sha3_256(const std::vector<uint8_t>& data);
    std::vector<uint8_t> sha3_512(const std::vector<uint8_t>& data);

    // Standard alphabet with padding, no line breaks
    std::string base64Encode(const std::vector<uint8_t>& data);
    // Rejects characters outside the alphabet, misplaced or excess padding and
    // truncated quanta instead of skipping them.
    bool base64Decode(const std::string& b64, std::vector<uint8_t>& out, std::string* outError);

    // Lowercase hex
    std::string hexEncode(const std::vector<uint8_t>& data);

    // Uniform value in [min, max) from the OS-seeded generator. Requires min < max.
    uint32_t randomInRange(uint32_t min, uint64_t max);
}
} // namespace CapBridge
