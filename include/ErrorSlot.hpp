#pragma once

#include <optional>
#include <string>

namespace CapBridge {

// Operational failure reported by a host service. Rendered into the error
// slot as "<Kind>: <detail>".
struct BridgeError {
    enum class Kind {
        UnknownSession,
        UnknownRequest,
        InvalidOptions,
        TransportError,
        InvalidEncoding,
        Protocol,
        Process,
        Json,
        Html,
        Internal
    };

    Kind kind = Kind::Internal;
    std::string detail;

    BridgeError() = default;
    BridgeError(Kind k, std::string d) : kind(k), detail(std::move(d)) {}

    std::string message() const { return std::string(kindName(kind)) + ": " + detail; }
    static const char *kindName(Kind k);
};

// Marker returned by ErrorSlot::set. A capability handler returns it to tell
// the registry the call failed softly (nil to the script, message in the slot).
struct SoftFailure {};

// Per-context holder of the last operational failure. Successful calls never
// clear it; only the next failure overwrites it.
class ErrorSlot {
public:
    SoftFailure set(std::string message)
    {
        m_message = std::move(message);
        return SoftFailure{};
    }
    SoftFailure set(const BridgeError &err) { return set(err.message()); }

    std::optional<std::string> last() const { return m_message; }
    bool hasError() const { return m_message.has_value(); }

private:
    std::optional<std::string> m_message;
};

inline const char *BridgeError::kindName(Kind k)
{
    switch (k)
    {
    case Kind::UnknownSession: return "UnknownSession";
    case Kind::UnknownRequest: return "UnknownRequest";
    case Kind::InvalidOptions: return "InvalidOptions";
    case Kind::TransportError: return "TransportError";
    case Kind::InvalidEncoding: return "InvalidEncoding";
    case Kind::Protocol: return "Protocol";
    case Kind::Process: return "Process";
    case Kind::Json: return "Json";
    case Kind::Html: return "Html";
    case Kind::Internal: return "Internal";
    }
    return "Internal";
}

} // namespace CapBridge
