// exceptions.hpp
// Error Codes and Exception Types for the barvault Time-Series Core
// Every failure kind has a stable ErrorCode so the C boundary can map exceptions to statuses

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace barvault {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : std::int32_t {
    Ok = 0,
    CapacityInvalid = 1,
    EmptyBufferAmend = 2,
    IndexOutOfRange = 3,
    UnknownIndicatorId = 4,
    InvalidBar = 5,
    InvalidArgument = 6,
    DuplicateIndicatorId = 7,
    DataError = 8,
    Internal = 99
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                   return "Ok";
        case ErrorCode::CapacityInvalid:      return "CapacityInvalid";
        case ErrorCode::EmptyBufferAmend:     return "EmptyBufferAmend";
        case ErrorCode::IndexOutOfRange:      return "IndexOutOfRange";
        case ErrorCode::UnknownIndicatorId:   return "UnknownIndicatorId";
        case ErrorCode::InvalidBar:           return "InvalidBar";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::DuplicateIndicatorId: return "DuplicateIndicatorId";
        case ErrorCode::DataError:            return "DataError";
        case ErrorCode::Internal:             return "Internal";
    }
    return "Unknown";
}

// ============================================================================
// Exception Hierarchy
// ============================================================================

class BarVaultException : public std::runtime_error {
public:
    explicit BarVaultException(const std::string& msg, ErrorCode code = ErrorCode::Internal)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class CapacityInvalidException : public BarVaultException {
public:
    explicit CapacityInvalidException(const std::string& msg)
        : BarVaultException("Capacity Error: " + msg, ErrorCode::CapacityInvalid) {}
};

class EmptyBufferAmendException : public BarVaultException {
public:
    explicit EmptyBufferAmendException(const std::string& msg)
        : BarVaultException("Amend Error: " + msg, ErrorCode::EmptyBufferAmend) {}
};

class IndexOutOfRangeException : public BarVaultException {
public:
    IndexOutOfRangeException(std::int64_t index, std::size_t size)
        : BarVaultException("Index Error: logical index " + std::to_string(index) +
                            " outside [0, " + std::to_string(size) + ")",
                            ErrorCode::IndexOutOfRange),
          index_(index), size_(size) {}

    std::int64_t index() const noexcept { return index_; }
    std::size_t size() const noexcept { return size_; }

private:
    std::int64_t index_;
    std::size_t size_;
};

class UnknownIndicatorIdException : public BarVaultException {
public:
    explicit UnknownIndicatorIdException(const std::string& id)
        : BarVaultException("Indicator Error: unknown indicator id '" + id + "'",
                            ErrorCode::UnknownIndicatorId) {}
};

class DuplicateIndicatorIdException : public BarVaultException {
public:
    explicit DuplicateIndicatorIdException(const std::string& id)
        : BarVaultException("Indicator Error: id '" + id + "' is already registered",
                            ErrorCode::DuplicateIndicatorId) {}
};

class InvalidBarException : public BarVaultException {
public:
    explicit InvalidBarException(const std::string& msg)
        : BarVaultException("Bar Error: " + msg, ErrorCode::InvalidBar) {}
};

class InvalidArgumentException : public BarVaultException {
public:
    explicit InvalidArgumentException(const std::string& msg)
        : BarVaultException("Argument Error: " + msg, ErrorCode::InvalidArgument) {}
};

class DataException : public BarVaultException {
public:
    explicit DataException(const std::string& msg)
        : BarVaultException("Data Error: " + msg, ErrorCode::DataError) {}
};

} // namespace barvault
