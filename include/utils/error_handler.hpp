#pragma once

#include <string>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>
#include <vector>

namespace voiceguard {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories for classification and reporting
 */
enum class ErrorCategory {
    VALIDATION,
    STORAGE,
    AUDIO_PROCESSING,
    MODEL_LOADING,
    EMBEDDING,
    CONFIGURATION,
    WORKFLOW,
    UNKNOWN
};

std::string toString(ErrorCategory category);
std::string toString(ErrorSeverity severity);

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "");
};

/**
 * Base exception for every fault raised by the engine
 */
class VoiceGuardException : public std::exception {
public:
    explicit VoiceGuardException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

/**
 * User-correctable input error: bad date, empty name, threshold out of range,
 * malformed embedding text, record with an id staged in a session.
 */
class ValidationException : public VoiceGuardException {
public:
    ValidationException(const std::string& message, const std::string& field = "");
};

class DimensionMismatchException : public VoiceGuardException {
public:
    DimensionMismatchException(size_t expected, size_t actual);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

/**
 * Durable state could not be written; the operation in flight failed and the
 * previous content is untouched.
 */
class StorageException : public VoiceGuardException {
public:
    StorageException(const std::string& message, const std::string& path = "");
};

class AudioProcessingException : public VoiceGuardException {
public:
    AudioProcessingException(const std::string& message, const std::string& path = "");
};

class ModelLoadingException : public VoiceGuardException {
public:
    ModelLoadingException(const std::string& message, const std::string& model_path = "");
};

class EmbeddingException : public VoiceGuardException {
public:
    EmbeddingException(const std::string& message, const std::string& context = "");
};

class ConfigurationException : public VoiceGuardException {
public:
    ConfigurationException(const std::string& message, const std::string& path = "");
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error sink. Reported errors are logged, kept in a bounded history
 * and forwarded to an optional callback. Reporting never rethrows.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "");

    void setErrorCallback(ErrorCallback callback);

    // UNKNOWN counts every category
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();

    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

} // namespace utils
} // namespace voiceguard
