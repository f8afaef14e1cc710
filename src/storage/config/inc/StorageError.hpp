#pragma once

#include <stdexcept>
#include <string>
#include <vector>

enum class StorageErrorCode {
    // Configuration errors, raised while parsing a URI
    MalformedPath,
    MissingVersion,
    BadRowBound,
    UnsupportedFormat,

    // Binding errors, raised before any row is produced
    UnknownGenerator,
    VersionMismatch,
    InvalidFlags,
    UnknownTable,

    // Per-operation errors
    NotImplemented,
    OperationNotSupported,
    UnexpectedBasename,

    // Provider registry
    UnknownProvider
};

const char* error_code_to_string(StorageErrorCode code);

class StorageError : public std::runtime_error {
public:
    StorageError(StorageErrorCode code, const std::string& message);

    StorageErrorCode code() const noexcept { return code_; }

private:
    StorageErrorCode code_;
};

class VersionMismatchError : public StorageError {
public:
    VersionMismatchError(const std::string& generator,
                         const std::string& expected,
                         const std::string& actual);

    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class InvalidFlagsError : public StorageError {
public:
    InvalidFlagsError(const std::vector<std::string>& flags, const std::string& cause);

    const std::vector<std::string>& flags() const noexcept { return flags_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::vector<std::string> flags_;
    std::string cause_;
};

class OperationNotSupportedError : public StorageError {
public:
    explicit OperationNotSupportedError(const std::string& operation);

    const std::string& operation() const noexcept { return operation_; }

private:
    std::string operation_;
};
