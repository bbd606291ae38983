#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <random>
#include <sstream>

namespace voiceguard {
namespace utils {

std::string toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "Validation";
        case ErrorCategory::STORAGE: return "Storage";
        case ErrorCategory::AUDIO_PROCESSING: return "Audio";
        case ErrorCategory::MODEL_LOADING: return "ModelLoading";
        case ErrorCategory::EMBEDDING: return "Embedding";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::WORKFLOW: return "Workflow";
        case ErrorCategory::UNKNOWN: break;
    }
    return "Unknown";
}

std::string toString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARN";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "ERROR";
}

ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()) {

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

VoiceGuardException::VoiceGuardException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* VoiceGuardException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

ValidationException::ValidationException(const std::string& message, const std::string& field)
    : VoiceGuardException(ErrorInfo(ErrorCategory::VALIDATION, ErrorSeverity::WARNING,
                                     message, field, "Validation")) {
}

namespace {

std::string dimensionDetails(size_t expected, size_t actual) {
    return "expected " + std::to_string(expected) + ", got " + std::to_string(actual);
}

} // namespace

DimensionMismatchException::DimensionMismatchException(size_t expected, size_t actual)
    : VoiceGuardException(ErrorInfo(ErrorCategory::EMBEDDING, ErrorSeverity::ERROR,
                                    "Embedding dimension mismatch",
                                    dimensionDetails(expected, actual), "Embedding")),
      expected_(expected), actual_(actual) {
}

StorageException::StorageException(const std::string& message, const std::string& path)
    : VoiceGuardException(ErrorInfo(ErrorCategory::STORAGE, ErrorSeverity::CRITICAL,
                                    message, path, "RecordStore")) {
}

AudioProcessingException::AudioProcessingException(const std::string& message, const std::string& path)
    : VoiceGuardException(ErrorInfo(ErrorCategory::AUDIO_PROCESSING, ErrorSeverity::ERROR,
                                    message, path, "AudioProcessing")) {
}

ModelLoadingException::ModelLoadingException(const std::string& message, const std::string& model_path)
    : VoiceGuardException(ErrorInfo(ErrorCategory::MODEL_LOADING, ErrorSeverity::CRITICAL,
                                    message, model_path, "ModelLoading")) {
}

EmbeddingException::EmbeddingException(const std::string& message, const std::string& context)
    : VoiceGuardException(ErrorInfo(ErrorCategory::EMBEDDING, ErrorSeverity::ERROR,
                                    message, "", context.empty() ? "Embedding" : context)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& path)
    : VoiceGuardException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::ERROR,
                                    message, path, "Configuration")) {
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context) {
    if (auto vg = dynamic_cast<const VoiceGuardException*>(&e)) {
        ErrorInfo error = vg->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        reportError(error);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = std::move(callback);
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                        [category](const ErrorInfo& error) {
                            return error.category == category;
                        });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = std::max<size_t>(1, max_size);
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << toString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

} // namespace utils
} // namespace voiceguard
