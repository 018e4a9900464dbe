#ifndef STABLESWAP_ERROR_HPP
#define STABLESWAP_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stableswap {

// =============================================================================
// Error Kinds
// =============================================================================

enum class ErrorKind : uint8_t {
    Structural = 0,            // buffer too short or malformed for the layout
    WidthOverflow = 1,         // value does not fit the target integer width
    Ownership = 2,             // account not owned by the expected program
    Uninitialized = 3,         // account's initialization flag unset
    UnsupportedOperation = 4,  // encode requested for an unstable layout
};

std::string to_string(ErrorKind kind);

// =============================================================================
// Exceptions
// =============================================================================

// Base of every codec failure. All are terminal; none are retried locally.
class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class StructuralError : public CodecError {
public:
    explicit StructuralError(const std::string& msg)
        : CodecError(ErrorKind::Structural, msg) {}
};

class WidthOverflowError : public CodecError {
public:
    explicit WidthOverflowError(const std::string& msg)
        : CodecError(ErrorKind::WidthOverflow, msg) {}
};

class OwnershipError : public CodecError {
public:
    explicit OwnershipError(const std::string& msg)
        : CodecError(ErrorKind::Ownership, msg) {}
};

class UninitializedError : public CodecError {
public:
    explicit UninitializedError(const std::string& msg)
        : CodecError(ErrorKind::Uninitialized, msg) {}
};

class UnsupportedOperationError : public CodecError {
public:
    explicit UnsupportedOperationError(const std::string& msg)
        : CodecError(ErrorKind::UnsupportedOperation, msg) {}
};

// Configuration file problems (unreadable file, unknown enum value)
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace stableswap

#endif // STABLESWAP_ERROR_HPP
