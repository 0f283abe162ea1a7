#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace blobfig {

// ------------------------------
// Error model
// ------------------------------

// Base of every error thrown by blobfig. Callers that do not care which
// direction failed can catch this alone.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg);
};

enum class EncodeErrorKind {
    DuplicateKey,
    ArrayLengthMismatch,
    SizeOverflow,
    InvalidKey,
    InvalidUtf8,
};

enum class DecodeErrorKind {
    BadMagic,
    UnsupportedVersion,
    Truncated,
    TagMismatch,
    InvalidTag,
    InvalidDType,
    Misaligned,
    ArithmeticOverflow,
    InvalidUtf8,
    DuplicateKey,
    DepthExceeded,
    LengthMismatch,
};

enum class AccessErrorKind {
    NotFound,
    NotAnObject,
    MalformedPath,
    TypeMismatch,
};

std::string to_string(EncodeErrorKind k);
std::string to_string(DecodeErrorKind k);
std::string to_string(AccessErrorKind k);

class EncodeError : public Error {
public:
    EncodeError(EncodeErrorKind k, const std::string& msg);
    EncodeErrorKind kind() const noexcept;

private:
    EncodeErrorKind kind_;
};

class DecodeError : public Error {
public:
    DecodeError(DecodeErrorKind k, std::size_t offset, const std::string& msg);
    DecodeErrorKind kind() const noexcept;
    // Absolute buffer offset where the problem was detected.
    std::size_t offset() const noexcept;

private:
    DecodeErrorKind kind_;
    std::size_t offset_;
};

class AccessError : public Error {
public:
    AccessError(AccessErrorKind k, const std::string& path, const std::string& msg);
    AccessErrorKind kind() const noexcept;
    const std::string& path() const noexcept;

private:
    AccessErrorKind kind_;
    std::string path_;
};

class IoError : public Error {
public:
    explicit IoError(const std::string& msg);
};

} // namespace blobfig
