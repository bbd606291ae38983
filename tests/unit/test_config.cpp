#include <gtest/gtest.h>
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/file_utils.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <random>

using namespace voiceguard::utils;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        test_dir = fs::temp_directory_path() / ("voiceguard_config_" + std::to_string(rd()));
        fs::create_directories(test_dir);
        config_path = (test_dir / "config.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void writeRaw(const std::string& content) {
        std::ofstream out(config_path, std::ios::trunc);
        out << content;
    }

    fs::path test_dir;
    std::string config_path;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = ConfigPolicy::defaults();
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 0.8);
    EXPECT_EQ(config.getRegistrationScript(), "My voice is my passport. Please verify me.");
    EXPECT_EQ(config.getVerificationScript(), "I solemnly swear that I am up to no good.");
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getStorePath(), "users.json");
    EXPECT_TRUE(config.getConfigPath().empty());
}

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
    auto config = ConfigPolicy::load(config_path);

    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), ConfigPolicy::kDefaultSimilarityThreshold);
    ASSERT_TRUE(fs::exists(config_path));

    std::string content;
    ASSERT_TRUE(readFile(config_path, content));
    auto j = nlohmann::json::parse(content);
    EXPECT_DOUBLE_EQ(j["similarity_threshold"].get<double>(), 0.8);
    EXPECT_EQ(j["registration_script"], ConfigPolicy::kDefaultRegistrationScript);
}

TEST_F(ConfigTest, MalformedFileIsReplacedWithDefaults) {
    writeRaw("{ this is not json");

    auto config = ConfigPolicy::load(config_path);
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 0.8);

    std::string content;
    ASSERT_TRUE(readFile(config_path, content));
    EXPECT_FALSE(nlohmann::json::parse(content, nullptr, false).is_discarded());
}

TEST_F(ConfigTest, MissingFieldsFallBackToDefaults) {
    writeRaw(R"({"similarity_threshold": 0.65})");

    auto config = ConfigPolicy::load(config_path);
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 0.65);
    EXPECT_EQ(config.getRegistrationScript(), ConfigPolicy::kDefaultRegistrationScript);
    EXPECT_EQ(config.getVerificationScript(), ConfigPolicy::kDefaultVerificationScript);
}

TEST_F(ConfigTest, InvalidFieldsFallBackToDefaults) {
    writeRaw(R"({"similarity_threshold": 1.7, "registration_script": 42,
                 "verification_script": "", "store_path": "data/people.json"})");

    auto config = ConfigPolicy::load(config_path);
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 0.8);
    EXPECT_EQ(config.getRegistrationScript(), ConfigPolicy::kDefaultRegistrationScript);
    EXPECT_EQ(config.getVerificationScript(), ConfigPolicy::kDefaultVerificationScript);
    EXPECT_EQ(config.getStorePath(), "data/people.json");
}

TEST_F(ConfigTest, NonNumericThresholdFallsBack) {
    writeRaw(R"({"similarity_threshold": "high"})");
    EXPECT_DOUBLE_EQ(ConfigPolicy::load(config_path).getSimilarityThreshold(), 0.8);
}

TEST_F(ConfigTest, SaveThenLoad) {
    auto config = ConfigPolicy::load(config_path);
    config.setSimilarityThreshold(0.72);
    config.setRegistrationScript("Register me");
    config.setVerificationScript("Check me");
    config.save();

    auto reloaded = ConfigPolicy::load(config_path);
    EXPECT_DOUBLE_EQ(reloaded.getSimilarityThreshold(), 0.72);
    EXPECT_EQ(reloaded.getRegistrationScript(), "Register me");
    EXPECT_EQ(reloaded.getVerificationScript(), "Check me");
}

TEST_F(ConfigTest, SaveWithoutPathFails) {
    auto config = ConfigPolicy::defaults();
    EXPECT_THROW(config.save(), ConfigurationException);

    config.save(config_path);
    EXPECT_EQ(config.getConfigPath(), config_path);
    EXPECT_TRUE(fs::exists(config_path));
}

TEST_F(ConfigTest, ThresholdSetterValidatesRange) {
    auto config = ConfigPolicy::defaults();

    EXPECT_NO_THROW(config.setSimilarityThreshold(0.0));
    EXPECT_NO_THROW(config.setSimilarityThreshold(1.0));
    EXPECT_THROW(config.setSimilarityThreshold(-0.01), ValidationException);
    EXPECT_THROW(config.setSimilarityThreshold(1.01), ValidationException);
    EXPECT_DOUBLE_EQ(config.getSimilarityThreshold(), 1.0);
}

TEST_F(ConfigTest, ParseThresholdText) {
    EXPECT_DOUBLE_EQ(ConfigPolicy::parseSimilarityThreshold("0.75"), 0.75);
    EXPECT_DOUBLE_EQ(ConfigPolicy::parseSimilarityThreshold("1"), 1.0);
    EXPECT_DOUBLE_EQ(ConfigPolicy::parseSimilarityThreshold("0.5 "), 0.5);

    EXPECT_THROW(ConfigPolicy::parseSimilarityThreshold(""), ValidationException);
    EXPECT_THROW(ConfigPolicy::parseSimilarityThreshold("abc"), ValidationException);
    EXPECT_THROW(ConfigPolicy::parseSimilarityThreshold("0.5x"), ValidationException);
    EXPECT_THROW(ConfigPolicy::parseSimilarityThreshold("1.5"), ValidationException);
    EXPECT_THROW(ConfigPolicy::parseSimilarityThreshold("-0.2"), ValidationException);
    EXPECT_THROW(ConfigPolicy::parseSimilarityThreshold("nan"), ValidationException);
}

TEST_F(ConfigTest, EmptyScriptsRejected) {
    auto config = ConfigPolicy::defaults();
    EXPECT_THROW(config.setRegistrationScript(""), ValidationException);
    EXPECT_THROW(config.setVerificationScript(""), ValidationException);
    EXPECT_EQ(config.getRegistrationScript(), ConfigPolicy::kDefaultRegistrationScript);
}
