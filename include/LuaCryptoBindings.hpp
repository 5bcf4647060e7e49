#pragma once

namespace CapBridge {

class CapabilityRegistry;

// Digest and encoding capabilities. Provides:
//   md5(bytes), sha1(bytes), sha2_256(bytes), sha2_512(bytes),
//   sha3_256(bytes), sha3_512(bytes)  -> bytes   -- raw digest
//   hex(bytes)                        -> text    -- lowercase hex
//   base64_encode(bytes)              -> text
//   base64_decode(text)               -> bytes|nil
// `bytes` accepts a string or a table of integers in [0,255].
void registerLuaCryptoBindings(CapabilityRegistry &reg);

} // namespace CapBridge
