#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace liarslie {

enum class ErrorCode {
    OK = 0,
    DECODE_ERROR,
    AUTH_ERROR,
    NETWORK_ERROR,
    TASK_FAILURE,
    CONFIG_ERROR,
    CRYPTO_ERROR,
    IO_ERROR,
    INVALID_ARGUMENT,
    INVALID_STATE,
    NOT_FOUND,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), timestamp(0) {}

    std::string describe() const;
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

// Collects errors that were absorbed at a fan-out join point so that a round
// can keep going while the failures stay observable.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;

    Error getLastError() const;
    bool hasErrors() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define LIARSLIE_CHECK(expr, code, msg) if (!(expr)) return liarslie::makeError(code, msg)

}
