#include "StorageError.hpp"
#include "StringUtils.hpp"

const char* error_code_to_string(StorageErrorCode code) {
    switch (code) {
        case StorageErrorCode::MalformedPath:         return "MalformedPath";
        case StorageErrorCode::MissingVersion:        return "MissingVersion";
        case StorageErrorCode::BadRowBound:           return "BadRowBound";
        case StorageErrorCode::UnsupportedFormat:     return "UnsupportedFormat";
        case StorageErrorCode::UnknownGenerator:      return "UnknownGenerator";
        case StorageErrorCode::VersionMismatch:       return "VersionMismatch";
        case StorageErrorCode::InvalidFlags:          return "InvalidFlags";
        case StorageErrorCode::UnknownTable:          return "UnknownTable";
        case StorageErrorCode::NotImplemented:        return "NotImplemented";
        case StorageErrorCode::OperationNotSupported: return "OperationNotSupported";
        case StorageErrorCode::UnexpectedBasename:    return "UnexpectedBasename";
        case StorageErrorCode::UnknownProvider:       return "UnknownProvider";
        default:                                      return "Unknown";
    }
}

StorageError::StorageError(StorageErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

VersionMismatchError::VersionMismatchError(const std::string& generator,
                                           const std::string& expected,
                                           const std::string& actual)
    : StorageError(StorageErrorCode::VersionMismatch,
                   "expected " + generator + " version \"" + expected + "\" but got \"" + actual + "\"")
    , expected_(expected)
    , actual_(actual) {}

InvalidFlagsError::InvalidFlagsError(const std::vector<std::string>& flags, const std::string& cause)
    : StorageError(StorageErrorCode::InvalidFlags,
                   "parsing parameters " + StringUtils::join(flags, " ") + ": " + cause)
    , flags_(flags)
    , cause_(cause) {}

OperationNotSupportedError::OperationNotSupportedError(const std::string& operation)
    : StorageError(StorageErrorCode::OperationNotSupported,
                   "workload storage does not support " + operation)
    , operation_(operation) {}
