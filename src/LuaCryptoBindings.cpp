#include "LuaCryptoBindings.hpp"
#include "CapabilityRegistry.hpp"
#include "CryptoHelpers.hpp"

namespace CapBridge {

using DigestFn = std::vector<uint8_t> (*)(const std::vector<uint8_t> &);

static void addDigest(CapabilityRegistry &reg, const std::string &name, DigestFn fn, const std::string &algo)
{
    CapabilityDescriptor d;
    d.name = name;
    d.params = {{"data", ParamType::Bytes}};
    d.handler = [fn](const CallArgs &args) -> CapabilityResult {
        return fromNativeBytes(fn(args.bytes(0)));
    };
    d.signature = name + "(bytes) -> bytes";
    d.summary = "Raw " + algo + " digest of the input.";
    d.example = "local h = hex(" + name + "(\"abc\"))";
    d.sourceFile = __FILE__;
    reg.add(std::move(d));
}

void registerLuaCryptoBindings(CapabilityRegistry &reg)
{
    addDigest(reg, "md5", &CryptoHelpers::md5, "MD5");
    addDigest(reg, "sha1", &CryptoHelpers::sha1, "SHA-1");
    addDigest(reg, "sha2_256", &CryptoHelpers::sha2_256, "SHA-256");
    addDigest(reg, "sha2_512", &CryptoHelpers::sha2_512, "SHA-512");
    addDigest(reg, "sha3_256", &CryptoHelpers::sha3_256, "SHA3-256");
    addDigest(reg, "sha3_512", &CryptoHelpers::sha3_512, "SHA3-512");

    CapabilityDescriptor hex;
    hex.name = "hex";
    hex.params = {{"data", ParamType::Bytes}};
    hex.handler = [](const CallArgs &args) -> CapabilityResult {
        return DynamicValue::text(CryptoHelpers::hexEncode(args.bytes(0)));
    };
    hex.signature = "hex(bytes) -> text";
    hex.summary = "Lowercase hexadecimal encoding.";
    hex.example = "hex({0, 255, 16}) -- \"00ff10\"";
    hex.sourceFile = __FILE__;
    reg.add(std::move(hex));

    CapabilityDescriptor enc;
    enc.name = "base64_encode";
    enc.params = {{"data", ParamType::Bytes}};
    enc.handler = [](const CallArgs &args) -> CapabilityResult {
        return DynamicValue::text(CryptoHelpers::base64Encode(args.bytes(0)));
    };
    enc.signature = "base64_encode(bytes) -> text";
    enc.summary = "Standard base64 with padding.";
    enc.example = "base64_encode(\"hi\") -- \"aGk=\"";
    enc.sourceFile = __FILE__;
    reg.add(std::move(enc));

    ErrorSlot &errors = reg.errors();
    CapabilityDescriptor dec;
    dec.name = "base64_decode";
    dec.params = {{"text", ParamType::Text}};
    dec.handler = [&errors](const CallArgs &args) -> CapabilityResult {
        Bytes out;
        std::string err;
        if (!CryptoHelpers::base64Decode(args.text(0), out, &err))
            return errors.set(BridgeError(BridgeError::Kind::InvalidEncoding, err));
        return fromNativeBytes(out);
    };
    dec.signature = "base64_decode(text) -> bytes|nil";
    dec.summary = "Strict base64 decoding; nil and last_err() on malformed input.";
    dec.example = "local raw = base64_decode(\"aGk=\")";
    dec.sourceFile = __FILE__;
    reg.add(std::move(dec));
}

} // namespace CapBridge
