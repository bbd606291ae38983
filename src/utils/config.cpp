#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/file_utils.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>

namespace voiceguard {
namespace utils {

using json = nlohmann::json;

const char* const ConfigPolicy::kDefaultRegistrationScript =
    "My voice is my passport. Please verify me.";
const char* const ConfigPolicy::kDefaultVerificationScript =
    "I solemnly swear that I am up to no good.";
const char* const ConfigPolicy::kDefaultLogLevel = "INFO";
const char* const ConfigPolicy::kDefaultModelPath =
    "pretrained_models/spkrec-ecapa-voxceleb/embedding_model.onnx";
const char* const ConfigPolicy::kDefaultStorePath = "users.json";

namespace {

void readString(const json& j, const char* key, std::string& target) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (it->is_string() && !it->get<std::string>().empty()) {
        target = it->get<std::string>();
    } else {
        Logger::warn(std::string("Ignoring invalid configuration value for '") + key + "'");
    }
}

} // namespace

ConfigPolicy ConfigPolicy::defaults() {
    return ConfigPolicy();
}

ConfigPolicy ConfigPolicy::load(const std::string& configPath) {
    ConfigPolicy config;
    config.configPath_ = configPath;

    std::string content;
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec) || !readFile(configPath, content)) {
        Logger::info("Configuration " + configPath + " not found, writing defaults");
        config.save();
        return config;
    }

    json j = json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        Logger::warn("Configuration " + configPath + " is malformed, restoring defaults");
        config.save();
        return config;
    }

    auto thresholdIt = j.find("similarity_threshold");
    if (thresholdIt != j.end()) {
        if (thresholdIt->is_number() && isValidThreshold(thresholdIt->get<double>())) {
            config.similarityThreshold_ = thresholdIt->get<double>();
        } else {
            Logger::warn("Ignoring invalid similarity_threshold, using " +
                         std::to_string(kDefaultSimilarityThreshold));
        }
    }

    readString(j, "registration_script", config.registrationScript_);
    readString(j, "verification_script", config.verificationScript_);
    readString(j, "log_level", config.logLevel_);
    readString(j, "model_path", config.modelPath_);
    readString(j, "store_path", config.storePath_);

    return config;
}

void ConfigPolicy::save() const {
    if (configPath_.empty()) {
        throw ConfigurationException("Configuration has no file path");
    }
    writeFileAtomically(configPath_, toJson());
}

void ConfigPolicy::save(const std::string& configPath) {
    configPath_ = configPath;
    save();
}

void ConfigPolicy::setSimilarityThreshold(double threshold) {
    if (!isValidThreshold(threshold)) {
        throw ValidationException("Similarity threshold must be between 0 and 1",
                                  "similarity_threshold");
    }
    similarityThreshold_ = threshold;
}

double ConfigPolicy::parseSimilarityThreshold(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);

    while (end && (*end == ' ' || *end == '\t')) {
        ++end;
    }
    if (end == begin || (end && *end != '\0') || errno == ERANGE) {
        throw ValidationException("Similarity threshold must be a number", "similarity_threshold");
    }
    if (!isValidThreshold(value)) {
        throw ValidationException("Similarity threshold must be between 0 and 1",
                                  "similarity_threshold");
    }
    return value;
}

void ConfigPolicy::setRegistrationScript(const std::string& script) {
    if (script.empty()) {
        throw ValidationException("Registration script must not be empty", "registration_script");
    }
    registrationScript_ = script;
}

void ConfigPolicy::setVerificationScript(const std::string& script) {
    if (script.empty()) {
        throw ValidationException("Verification script must not be empty", "verification_script");
    }
    verificationScript_ = script;
}

std::string ConfigPolicy::toJson() const {
    json j;
    j["similarity_threshold"] = similarityThreshold_;
    j["registration_script"] = registrationScript_;
    j["verification_script"] = verificationScript_;
    j["log_level"] = logLevel_;
    j["model_path"] = modelPath_;
    j["store_path"] = storePath_;
    return j.dump(2);
}

bool ConfigPolicy::isValidThreshold(double threshold) {
    return std::isfinite(threshold) && threshold >= 0.0 && threshold <= 1.0;
}

} // namespace utils
} // namespace voiceguard
