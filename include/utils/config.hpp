#pragma once

#include <string>

namespace voiceguard {
namespace utils {

/**
 * Application settings persisted as JSON. Only the similarity threshold is
 * consumed by matching; the scripts are shown to the speaker.
 */
class ConfigPolicy {
public:
    static constexpr double kDefaultSimilarityThreshold = 0.8;
    static const char* const kDefaultRegistrationScript;
    static const char* const kDefaultVerificationScript;
    static const char* const kDefaultLogLevel;
    static const char* const kDefaultModelPath;
    static const char* const kDefaultStorePath;

    /**
     * Load settings from configPath. A missing or malformed file is replaced
     * with defaults on disk; missing or invalid fields fall back to defaults.
     * @throws StorageException if the defaults cannot be written
     */
    static ConfigPolicy load(const std::string& configPath);

    // Defaults, not bound to any file until save(path) is called
    static ConfigPolicy defaults();

    void save() const;
    void save(const std::string& configPath);

    double getSimilarityThreshold() const { return similarityThreshold_; }
    const std::string& getRegistrationScript() const { return registrationScript_; }
    const std::string& getVerificationScript() const { return verificationScript_; }
    const std::string& getLogLevel() const { return logLevel_; }
    const std::string& getModelPath() const { return modelPath_; }
    const std::string& getStorePath() const { return storePath_; }
    const std::string& getConfigPath() const { return configPath_; }

    /**
     * @throws ValidationException unless 0 <= threshold <= 1
     */
    void setSimilarityThreshold(double threshold);

    /**
     * Parse user input such as "0.75".
     * @throws ValidationException on non-numeric or out-of-range text
     */
    static double parseSimilarityThreshold(const std::string& text);

    void setRegistrationScript(const std::string& script);
    void setVerificationScript(const std::string& script);
    void setLogLevel(const std::string& level) { logLevel_ = level; }
    void setModelPath(const std::string& path) { modelPath_ = path; }
    void setStorePath(const std::string& path) { storePath_ = path; }

    std::string toJson() const;

private:
    ConfigPolicy() = default;

    static bool isValidThreshold(double threshold);

    std::string configPath_;
    double similarityThreshold_ = kDefaultSimilarityThreshold;
    std::string registrationScript_ = kDefaultRegistrationScript;
    std::string verificationScript_ = kDefaultVerificationScript;
    std::string logLevel_ = kDefaultLogLevel;
    std::string modelPath_ = kDefaultModelPath;
    std::string storePath_ = kDefaultStorePath;
};

} // namespace utils
} // namespace voiceguard
