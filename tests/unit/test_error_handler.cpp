#include <gtest/gtest.h>
#include "utils/error_handler.hpp"
#include <stdexcept>

using namespace voiceguard::utils;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
    }

    void TearDown() override {
        ErrorHandler::getInstance().clearErrorHistory();
        ErrorHandler::getInstance().setErrorCallback(nullptr);
        ErrorHandler::getInstance().setMaxHistorySize(1000);
    }
};

TEST_F(ErrorHandlerTest, ErrorInfoCreation) {
    ErrorInfo error(ErrorCategory::STORAGE, ErrorSeverity::ERROR,
                    "Write failed", "users.json", "RecordStore");

    EXPECT_EQ(error.category, ErrorCategory::STORAGE);
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.message, "Write failed");
    EXPECT_EQ(error.details, "users.json");
    EXPECT_EQ(error.context, "RecordStore");
    EXPECT_EQ(error.id.rfind("err_", 0), 0u);
}

TEST_F(ErrorHandlerTest, ErrorInfoUniqueIds) {
    ErrorInfo error1(ErrorCategory::EMBEDDING, ErrorSeverity::WARNING, "Message 1");
    ErrorInfo error2(ErrorCategory::EMBEDDING, ErrorSeverity::WARNING, "Message 2");

    EXPECT_NE(error1.id, error2.id);
}

TEST_F(ErrorHandlerTest, ExceptionMessageIncludesDetails) {
    StorageException e("Cannot write record store", "/tmp/users.json");
    EXPECT_STREQ(e.what(), "Cannot write record store: /tmp/users.json");
    EXPECT_EQ(e.getErrorInfo().category, ErrorCategory::STORAGE);
    EXPECT_EQ(e.getErrorInfo().severity, ErrorSeverity::CRITICAL);

    EmbeddingException bare("Model produced no output");
    EXPECT_STREQ(bare.what(), "Model produced no output");
}

TEST_F(ErrorHandlerTest, SpecificExceptions) {
    ValidationException validation("Bad date", "date_of_birth");
    EXPECT_EQ(validation.getErrorInfo().category, ErrorCategory::VALIDATION);
    EXPECT_EQ(validation.getErrorInfo().severity, ErrorSeverity::WARNING);

    AudioProcessingException audio("Not a WAV file", "a.wav");
    EXPECT_EQ(audio.getErrorInfo().category, ErrorCategory::AUDIO_PROCESSING);

    ModelLoadingException model("Model missing", "model.onnx");
    EXPECT_EQ(model.getErrorInfo().category, ErrorCategory::MODEL_LOADING);
    EXPECT_EQ(model.getErrorInfo().details, "model.onnx");

    ConfigurationException config("No path");
    EXPECT_EQ(config.getErrorInfo().category, ErrorCategory::CONFIGURATION);
}

TEST_F(ErrorHandlerTest, DimensionMismatchCarriesBothSizes) {
    DimensionMismatchException e(192, 3);
    EXPECT_EQ(e.expected(), 192u);
    EXPECT_EQ(e.actual(), 3u);
    EXPECT_EQ(e.getErrorInfo().category, ErrorCategory::EMBEDDING);
    EXPECT_NE(std::string(e.what()).find("expected 192, got 3"), std::string::npos);
}

TEST_F(ErrorHandlerTest, ReportingKeepsHistoryAndCounts) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(ErrorInfo(ErrorCategory::STORAGE, ErrorSeverity::WARNING, "corrupt"));
    handler.reportError(ErrorInfo(ErrorCategory::EMBEDDING, ErrorSeverity::ERROR, "nan"));
    handler.reportError(ErrorInfo(ErrorCategory::STORAGE, ErrorSeverity::ERROR, "disk full"));

    EXPECT_EQ(handler.getErrorCount(), 3u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::STORAGE), 2u);
    EXPECT_EQ(handler.getErrorCount(ErrorCategory::EMBEDDING), 1u);

    auto recent = handler.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "nan");
    EXPECT_EQ(recent[1].message, "disk full");
}

TEST_F(ErrorHandlerTest, HistoryIsBounded) {
    auto& handler = ErrorHandler::getInstance();
    handler.setMaxHistorySize(2);

    for (int i = 0; i < 5; ++i) {
        handler.reportError(ErrorInfo(ErrorCategory::WORKFLOW, ErrorSeverity::INFO,
                                      "event " + std::to_string(i)));
    }

    auto recent = handler.getRecentErrors(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "event 3");
    EXPECT_EQ(recent[1].message, "event 4");
}

TEST_F(ErrorHandlerTest, CallbackReceivesReportedErrors) {
    auto& handler = ErrorHandler::getInstance();
    std::vector<std::string> seen;
    handler.setErrorCallback([&seen](const ErrorInfo& error) {
        seen.push_back(error.message);
    });

    handler.reportError(ErrorInfo(ErrorCategory::STORAGE, ErrorSeverity::ERROR, "first"));
    handler.reportError(ErrorInfo(ErrorCategory::STORAGE, ErrorSeverity::ERROR, "second"));

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "first");
    EXPECT_EQ(seen[1], "second");
}

TEST_F(ErrorHandlerTest, ThrowingCallbackDoesNotEscape) {
    auto& handler = ErrorHandler::getInstance();
    handler.setErrorCallback([](const ErrorInfo&) {
        throw std::runtime_error("callback failure");
    });

    EXPECT_NO_THROW(handler.reportError(
        ErrorInfo(ErrorCategory::WORKFLOW, ErrorSeverity::ERROR, "boom")));
    EXPECT_EQ(handler.getErrorCount(), 1u);
}

TEST_F(ErrorHandlerTest, ReportExceptionKeepsCategory) {
    auto& handler = ErrorHandler::getInstance();

    handler.reportError(StorageException("Write failed"), "Enrollment");
    handler.reportError(std::runtime_error("plain failure"), "Verification");

    auto recent = handler.getRecentErrors(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].category, ErrorCategory::STORAGE);
    EXPECT_EQ(recent[0].context, "Enrollment");
    EXPECT_EQ(recent[1].category, ErrorCategory::UNKNOWN);
    EXPECT_EQ(recent[1].message, "plain failure");
    EXPECT_EQ(recent[1].context, "Verification");
}
