#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/identity_workflow.hpp"
#include "core/task_queue.hpp"
#include "identity/record_store.hpp"
#include "models/onnx_embedding_extractor.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace voiceguard;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_REJECTED = 2,
    EXIT_FATAL = 3
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] <command> [options]\n"
              << "Commands:\n"
              << "  enroll --first <name> --last <name> --dob <YYYY-MM-DD> --audio <file.wav>\n"
              << "  verify --audio <file.wav>\n"
              << "  list\n"
              << "  delete <id>\n"
              << "  script registration|verification\n"
              << "  config show\n"
              << "  config set-threshold <0..1>\n"
              << "  config set-script registration|verification <text>\n"
              << "Options:\n"
              << "  --config <path>  Configuration file (default: config.json)\n"
              << "  --help, -h       Show this help message\n";
}

// Collects "--key value" pairs following the command
std::map<std::string, std::string> parseOptions(const std::vector<std::string>& args, size_t start) {
    std::map<std::string, std::string> options;
    for (size_t i = start; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0 || i + 1 >= args.size()) {
            throw utils::ValidationException("Unexpected argument '" + arg + "'");
        }
        options[arg.substr(2)] = args[++i];
    }
    return options;
}

std::string requireOption(const std::map<std::string, std::string>& options, const std::string& key) {
    auto it = options.find(key);
    if (it == options.end()) {
        throw utils::ValidationException("Missing required option --" + key);
    }
    return it->second;
}

int runEnroll(core::IdentityWorkflow& workflow, core::BackgroundWorker& worker,
              const std::map<std::string, std::string>& options) {
    core::EnrollmentRequest request;
    request.firstName = requireOption(options, "first");
    request.lastName = requireOption(options, "last");
    request.dateOfBirth = requireOption(options, "dob");
    request.audioPath = requireOption(options, "audio");

    auto outcome = worker.submit([&workflow, request]() { return workflow.enroll(request); }).get();
    if (outcome.status == core::EnrollmentStatus::CANCELLED) {
        std::cout << "Enrollment cancelled" << std::endl;
        return EXIT_REJECTED;
    }

    std::cout << "Registered " << outcome.record->fullName()
              << " (id " << *outcome.record->id() << ")" << std::endl;
    return EXIT_OK;
}

int runVerify(core::IdentityWorkflow& workflow, core::BackgroundWorker& worker,
              const utils::ConfigPolicy& config,
              const std::map<std::string, std::string>& options) {
    std::string audioPath = requireOption(options, "audio");

    auto result = worker.submit([&workflow, audioPath]() { return workflow.verify(audioPath); }).get();
    if (!result) {
        std::cout << "Verification cancelled" << std::endl;
        return EXIT_REJECTED;
    }

    switch (result->kind) {
        case identity::VerificationKind::MATCHED:
            std::cout << "Verified: " << result->record->fullName()
                      << " (similarity " << result->score << ")" << std::endl;
            return EXIT_OK;
        case identity::VerificationKind::NO_MATCH:
            std::cout << "No matching user found. Best similarity: " << result->score
                      << " (threshold " << config.getSimilarityThreshold() << ")" << std::endl;
            return EXIT_REJECTED;
        case identity::VerificationKind::NO_ENROLLMENTS:
            std::cout << "No users are registered yet" << std::endl;
            return EXIT_REJECTED;
    }
    return EXIT_REJECTED;
}

int runList(core::IdentityWorkflow& workflow) {
    auto records = workflow.listIdentities();
    if (records.empty()) {
        std::cout << "No users registered" << std::endl;
        return EXIT_OK;
    }
    for (const auto& record : records) {
        std::cout << (record.id() ? std::to_string(*record.id()) : std::string("-")) << "\t"
                  << record.fullName() << "\t"
                  << record.dateOfBirth().toString() << "\t"
                  << "dim=" << record.embedding().dimension() << std::endl;
    }
    return EXIT_OK;
}

int runDelete(core::IdentityWorkflow& workflow, const std::vector<std::string>& args, size_t index) {
    if (index >= args.size()) {
        throw utils::ValidationException("delete requires an id");
    }

    int64_t id = 0;
    try {
        size_t consumed = 0;
        id = std::stoll(args[index], &consumed);
        if (consumed != args[index].size()) {
            throw utils::ValidationException("Id must be an integer", args[index]);
        }
    } catch (const std::logic_error&) {
        throw utils::ValidationException("Id must be an integer", args[index]);
    }

    if (workflow.deleteIdentity(id)) {
        std::cout << "User " << id << " deleted" << std::endl;
        return EXIT_OK;
    }
    std::cout << "User not found - nothing deleted" << std::endl;
    return EXIT_REJECTED;
}

int runScript(const utils::ConfigPolicy& config, const std::vector<std::string>& args, size_t index) {
    std::string which = index < args.size() ? args[index] : "";
    if (which == "registration") {
        std::cout << config.getRegistrationScript() << std::endl;
    } else if (which == "verification") {
        std::cout << config.getVerificationScript() << std::endl;
    } else {
        throw utils::ValidationException("script expects 'registration' or 'verification'");
    }
    return EXIT_OK;
}

int runConfig(utils::ConfigPolicy& config, const std::vector<std::string>& args, size_t index) {
    std::string action = index < args.size() ? args[index] : "show";

    if (action == "show") {
        std::cout << config.toJson() << std::endl;
        return EXIT_OK;
    }

    if (action == "set-threshold") {
        if (index + 1 >= args.size()) {
            throw utils::ValidationException("set-threshold requires a value");
        }
        config.setSimilarityThreshold(utils::ConfigPolicy::parseSimilarityThreshold(args[index + 1]));
        config.save();
        std::cout << "Similarity threshold updated to " << config.getSimilarityThreshold() << std::endl;
        return EXIT_OK;
    }

    if (action == "set-script") {
        if (index + 2 >= args.size()) {
            throw utils::ValidationException("set-script requires a kind and text");
        }
        const std::string& which = args[index + 1];
        if (which == "registration") {
            config.setRegistrationScript(args[index + 2]);
        } else if (which == "verification") {
            config.setVerificationScript(args[index + 2]);
        } else {
            throw utils::ValidationException("set-script expects 'registration' or 'verification'");
        }
        config.save();
        std::cout << "Script updated" << std::endl;
        return EXIT_OK;
    }

    throw utils::ValidationException("Unknown config action '" + action + "'");
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath = "config.json";

    size_t index = 0;
    while (index < args.size() && args[index].rfind("-", 0) == 0) {
        if (args[index] == "--help" || args[index] == "-h") {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        if (args[index] == "--config" && index + 1 < args.size()) {
            configPath = args[index + 1];
            index += 2;
            continue;
        }
        std::cerr << "Unknown option " << args[index] << std::endl;
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    if (index >= args.size()) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    const std::string command = args[index++];

    try {
        utils::Logger::initialize();
        auto config = utils::ConfigPolicy::load(configPath);
        utils::Logger::setLevel(utils::Logger::parseLevel(config.getLogLevel()));

        identity::JsonRecordStore store(config.getStorePath());
        store.initialize();

        std::string modelPath = config.getModelPath();
        models::LazyEmbeddingExtractor extractor([modelPath]() {
            return std::make_unique<models::OnnxEmbeddingExtractor>(modelPath);
        });
        core::IdentityWorkflow workflow(store, extractor, config);

        if (command == "enroll" || command == "verify") {
            core::BackgroundWorker worker;
            auto options = parseOptions(args, index);
            int code = command == "enroll" ? runEnroll(workflow, worker, options)
                                           : runVerify(workflow, worker, config, options);
            worker.shutdown();
            return code;
        } else if (command == "list") {
            return runList(workflow);
        } else if (command == "delete") {
            return runDelete(workflow, args, index);
        } else if (command == "script") {
            return runScript(config, args, index);
        } else if (command == "config") {
            return runConfig(config, args, index);
        }

        std::cerr << "Unknown command " << command << std::endl;
        printUsage(argv[0]);
        return EXIT_USAGE;

    } catch (const utils::ValidationException& e) {
        std::cerr << "Invalid input: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FATAL;
    }
}
