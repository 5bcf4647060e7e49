#include "CryptoHelpers.hpp"
#define CRYPTOPP_ENABLE_NAMESPACE_WEAK 1
#include <cryptopp/md5.h>
#include <cryptopp/osrng.h>
#include <cryptopp/sha.h>
#include <cryptopp/sha3.h>
#include <cryptopp/filters.h>
#include <cryptopp/base64.h>
#include <cryptopp/hex.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace CryptoPP;

namespace CapBridge {
namespace CryptoHelpers {

template <class Hash>
static std::vector<uint8_t> digestWith(const std::vector<uint8_t>& data){
    Hash h;
    std::vector<uint8_t> out(Hash::DIGESTSIZE);
    h.CalculateDigest(out.data(), data.empty() ? nullptr : data.data(), data.size());
    return out;
}

std::vector<uint8_t> md5(const std::vector<uint8_t>& data){ return digestWith<Weak::MD5>(data); }
std::vector<uint8_t> sha1(const std::vector<uint8_t>& data){ return digestWith<SHA1>(data); }
std::vector<uint8_t> sha2_256(const std::vector<uint8_t>& data){ return digestWith<SHA256>(data); }
std::vector<uint8_t> sha2_512(const std::vector<uint8_t>& data){ return digestWith<SHA512>(data); }
std::vector<uint8_t> sha3_256(const std::vector<uint8_t>& data){ return digestWith<SHA3_256>(data); }
std::vector<uint8_t> sha3_512(const std::vector<uint8_t>& data){ return digestWith<SHA3_512>(data); }

std::string base64Encode(const std::vector<uint8_t>& data){
    std::string out;
    StringSource ss(data.data(), data.size(), true,
        new Base64Encoder(new StringSink(out), false /* do not insert newlines */));
    return out;
}

static bool isBase64Char(char c){
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool base64Decode(const std::string& b64, std::vector<uint8_t>& out, std::string* outError){
    // Base64Decoder silently skips garbage, so validate first
    size_t pad = 0;
    while(pad < b64.size() && b64[b64.size() - 1 - pad] == '=') ++pad;
    size_t dataLen = b64.size() - pad;
    if(pad > 2){ if(outError) *outError = "invalid padding"; return false; }
    for(size_t i = 0; i < dataLen; ++i){
        if(!isBase64Char(b64[i])){
            if(outError) *outError = "invalid byte " + std::to_string((unsigned char)b64[i]) + ", offset " + std::to_string(i);
            return false;
        }
    }
    if(dataLen % 4 == 1){ if(outError) *outError = "invalid length"; return false; }
    if(pad > 0 && (b64.size() % 4 != 0 || dataLen % 4 == 0)){ if(outError) *outError = "invalid padding"; return false; }

    std::string decoded;
    StringSource ss(reinterpret_cast<const byte*>(b64.data()), dataLen, true, new Base64Decoder(new StringSink(decoded)));
    out.assign(decoded.begin(), decoded.end());
    return true;
}

std::string hexEncode(const std::vector<uint8_t>& data){
    std::string out;
    StringSource ss(data.data(), data.size(), true, new HexEncoder(new StringSink(out), false /* lowercase */));
    return out;
}

uint32_t randomInRange(uint32_t min, uint64_t max){
    if(max <= min || max > 0x100000000ULL) throw std::invalid_argument("randomInRange: empty or oversized range");
    AutoSeededRandomPool prng;
    return prng.GenerateWord32(min, static_cast<word32>(max - 1));
}

} // namespace CryptoHelpers
} // namespace CapBridge
