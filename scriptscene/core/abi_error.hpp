#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace scriptscene {

// Host-internal error taxonomy. Guests only ever see the sentinel of the
// failing ABI entry, never one of these values.
enum class AbiErrorKind : std::uint8_t {
    None = 0,
    NotAuthorized,   // handle is live but not granted to the caller
    NotFound,        // handle is not registered (stale or never allocated)
    TypeMismatch,    // handle resolves to a different resource kind
    InvalidEnum,     // enumerated field has no known variant
    DecodeError,     // malformed or truncated parameter block
    InvalidState,    // well-formed request rejected by a resource rule
};

inline const char* abi_error_name(AbiErrorKind kind) {
    switch (kind) {
        case AbiErrorKind::None: return "none";
        case AbiErrorKind::NotAuthorized: return "not-authorized";
        case AbiErrorKind::NotFound: return "not-found";
        case AbiErrorKind::TypeMismatch: return "type-mismatch";
        case AbiErrorKind::InvalidEnum: return "invalid-enum";
        case AbiErrorKind::DecodeError: return "decode-error";
        case AbiErrorKind::InvalidState: return "invalid-state";
    }
    return "unknown";
}

// Thrown by decoders and handlers; caught once per call by the ABI dispatcher.
class AbiError : public std::runtime_error {
public:
    AbiError(AbiErrorKind kind, const std::string& detail)
        : std::runtime_error(detail), kind_(kind) {}

    AbiErrorKind kind() const { return kind_; }

private:
    AbiErrorKind kind_;
};

// Non-throwing lookup result.
template <typename T>
struct AccessResult {
    T* value{nullptr};
    AbiErrorKind error{AbiErrorKind::None};

    static AccessResult ok(T* v) { return {v, AbiErrorKind::None}; }
    static AccessResult fail(AbiErrorKind kind) { return {nullptr, kind}; }

    explicit operator bool() const { return value != nullptr; }
};

} // namespace scriptscene
