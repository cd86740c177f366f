#ifndef TSDUMP_CORE_ERROR_H_
#define TSDUMP_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace tsdump {
namespace core {

/**
 * @brief Base class for all tsdump errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        DATA_CORRUPTION = 3,
        UNAVAILABLE = 4,
        INTERNAL = 5
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

    /**
     * @brief Short name of the concrete error type, used in diagnostics
     */
    virtual const char* name() const noexcept { return "Error"; }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
    const char* name() const noexcept override { return "InvalidArgumentError"; }
};

/**
 * @brief A metric or tag uid has no name in the uid tables.
 *
 * The row carrying the uid cannot be read; it is not an empty row.
 */
class ResolutionError : public Error {
public:
    explicit ResolutionError(const std::string& message) 
        : Error(message, Code::NOT_FOUND) {}
    const char* name() const noexcept override { return "ResolutionError"; }
};

/**
 * @brief Stored bytes do not follow the row or column encoding
 */
class IllegalDataError : public Error {
public:
    explicit IllegalDataError(const std::string& message) 
        : Error(message, Code::DATA_CORRUPTION) {}
    const char* name() const noexcept override { return "IllegalDataError"; }
};

/**
 * @brief A compacted column whose qualifier and value buffers disagree
 */
class MalformedColumnError : public IllegalDataError {
public:
    explicit MalformedColumnError(const std::string& message) 
        : IllegalDataError(message) {}
    const char* name() const noexcept override { return "MalformedColumnError"; }
};

class MalformedRowKeyError : public IllegalDataError {
public:
    explicit MalformedRowKeyError(const std::string& message) 
        : IllegalDataError(message) {}
    const char* name() const noexcept override { return "MalformedRowKeyError"; }
};

/**
 * @brief The store rejected or failed a scan or delete request
 */
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message) 
        : Error(message, Code::UNAVAILABLE) {}
    const char* name() const noexcept override { return "StoreError"; }
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message) 
        : Error(message, Code::INTERNAL) {}
    const char* name() const noexcept override { return "InternalError"; }
};

} // namespace core
} // namespace tsdump

#endif // TSDUMP_CORE_ERROR_H_
