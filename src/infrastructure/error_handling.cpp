#include "error_handling.h"
#include "utils/logger.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace liarslie {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::DECODE_ERROR: return "Decode error";
        case ErrorCode::AUTH_ERROR: return "Authentication error";
        case ErrorCode::NETWORK_ERROR: return "Network error";
        case ErrorCode::TASK_FAILURE: return "Task failure";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::CRYPTO_ERROR: return "Cryptographic error";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::INVALID_STATE: return "Invalid state";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string Error::describe() const {
    std::string out = errorToString(code);
    if (!message.empty()) out += ": " + message;
    if (!context.empty()) out += " [" + context + "]";
    return out;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::deque<Error> recentErrors;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = handler;
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    Error err = error;
    if (err.timestamp == 0) err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->recentErrors.push_back(err);
        if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
            impl_->recentErrors.pop_front();
        }
        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(err.code)]++;
        handler = impl_->handler;
    }

    utils::Logger::log(utils::LogLevel::WARN, "error", err.describe());

    if (handler) {
        handler(err);
    }
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ?
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.clear();
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->recentErrors.empty()) {
        return Error{};
    }
    return impl_->recentErrors.back();
}

bool ErrorHandler::hasErrors() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return !impl_->recentErrors.empty();
}

}
