#include "blobfig/error.hpp"

namespace blobfig {

Error::Error(const std::string& msg)
    : std::runtime_error(msg) {}

std::string to_string(EncodeErrorKind k) {
    switch (k) {
        case EncodeErrorKind::DuplicateKey: return "DuplicateKey";
        case EncodeErrorKind::ArrayLengthMismatch: return "ArrayLengthMismatch";
        case EncodeErrorKind::SizeOverflow: return "SizeOverflow";
        case EncodeErrorKind::InvalidKey: return "InvalidKey";
        case EncodeErrorKind::InvalidUtf8: return "InvalidUtf8";
    }
    return "unknown";
}

std::string to_string(DecodeErrorKind k) {
    switch (k) {
        case DecodeErrorKind::BadMagic: return "BadMagic";
        case DecodeErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case DecodeErrorKind::Truncated: return "Truncated";
        case DecodeErrorKind::TagMismatch: return "TagMismatch";
        case DecodeErrorKind::InvalidTag: return "InvalidTag";
        case DecodeErrorKind::InvalidDType: return "InvalidDType";
        case DecodeErrorKind::Misaligned: return "Misaligned";
        case DecodeErrorKind::ArithmeticOverflow: return "ArithmeticOverflow";
        case DecodeErrorKind::InvalidUtf8: return "InvalidUtf8";
        case DecodeErrorKind::DuplicateKey: return "DuplicateKey";
        case DecodeErrorKind::DepthExceeded: return "DepthExceeded";
        case DecodeErrorKind::LengthMismatch: return "LengthMismatch";
    }
    return "unknown";
}

std::string to_string(AccessErrorKind k) {
    switch (k) {
        case AccessErrorKind::NotFound: return "NotFound";
        case AccessErrorKind::NotAnObject: return "NotAnObject";
        case AccessErrorKind::MalformedPath: return "MalformedPath";
        case AccessErrorKind::TypeMismatch: return "TypeMismatch";
    }
    return "unknown";
}

EncodeError::EncodeError(EncodeErrorKind k, const std::string& msg)
    : Error(msg), kind_(k) {}

EncodeErrorKind EncodeError::kind() const noexcept { return kind_; }

DecodeError::DecodeError(DecodeErrorKind k, std::size_t offset, const std::string& msg)
    : Error(msg + " (at offset " + std::to_string(offset) + ")"), kind_(k), offset_(offset) {}

DecodeErrorKind DecodeError::kind() const noexcept { return kind_; }

std::size_t DecodeError::offset() const noexcept { return offset_; }

AccessError::AccessError(AccessErrorKind k, const std::string& path, const std::string& msg)
    : Error(msg), kind_(k), path_(path) {}

AccessErrorKind AccessError::kind() const noexcept { return kind_; }

const std::string& AccessError::path() const noexcept { return path_; }

IoError::IoError(const std::string& msg)
    : Error(msg) {}

} // namespace blobfig
