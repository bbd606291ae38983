#include "identity/record_store.hpp"
#include "utils/error_handler.hpp"
#include "utils/file_utils.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <limits>

namespace voiceguard {
namespace identity {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json recordToJson(const IdentityRecord& record) {
    json j;
    if (record.id()) {
        j["id"] = *record.id();
    } else {
        j["id"] = nullptr;
    }
    j["first_name"] = record.firstName();
    j["last_name"] = record.lastName();
    j["date_of_birth"] = record.dateOfBirth().toString();
    j["embedding"] = record.embedding().toString();
    return j;
}

// Throws on any structural problem; the caller treats that as corruption
IdentityRecord recordFromJson(const json& j) {
    if (!j.is_object()) {
        throw utils::ValidationException("Record entry is not an object");
    }

    std::optional<int64_t> id;
    auto idIt = j.find("id");
    if (idIt != j.end() && !idIt->is_null()) {
        if (!idIt->is_number_integer()) {
            throw utils::ValidationException("Record id is not an integer", "id");
        }
        id = idIt->get<int64_t>();
    }

    const json& embeddingField = j.at("embedding");
    EmbeddingVector embedding = embeddingField.is_string()
        ? EmbeddingVector::fromString(embeddingField.get<std::string>())
        : EmbeddingVector::fromString(embeddingField.dump());

    return IdentityRecord(j.at("first_name").get<std::string>(),
                          j.at("last_name").get<std::string>(),
                          CalendarDate::parse(j.at("date_of_birth").get<std::string>()),
                          std::move(embedding),
                          id);
}

void reportCorruption(const std::string& path, const std::string& problem) {
    utils::ErrorInfo error(utils::ErrorCategory::STORAGE, utils::ErrorSeverity::WARNING,
                           "Record store is unreadable; treating it as empty",
                           problem, path);
    utils::ErrorHandler::getInstance().reportError(error);
}

} // namespace

bool RecordRepository::remove(int64_t id) {
    std::vector<IdentityRecord> records = load();
    const size_t initialSize = records.size();

    records.erase(std::remove_if(records.begin(), records.end(),
                                 [id](const IdentityRecord& r) {
                                     return r.id() && *r.id() == id;
                                 }),
                  records.end());

    if (records.size() == initialSize) {
        return false;
    }

    persist(records);
    return true;
}

int64_t RecordRepository::nextId(const std::vector<IdentityRecord>& existing) {
    int64_t maxId = 0;
    for (const auto& record : existing) {
        if (record.id() && *record.id() > maxId) {
            maxId = *record.id();
        }
    }
    if (maxId == std::numeric_limits<int64_t>::max()) {
        throw utils::StorageException("Record ids are exhausted",
                                      "id=" + std::to_string(maxId));
    }
    return maxId + 1;
}

JsonRecordStore::JsonRecordStore(std::string path)
    : path_(std::move(path)) {
}

bool JsonRecordStore::initialize() {
    std::vector<IdentityRecord> records;
    std::string problem;
    ReadStatus status = read(records, problem);

    if (status == ReadStatus::OK) {
        utils::Logger::debug("Record store " + path_ + " holds " +
                             std::to_string(records.size()) + " record(s)");
        return false;
    }

    if (status == ReadStatus::CORRUPT) {
        moveCorruptFileAside(problem);
    } else {
        utils::Logger::info("Creating empty record store at " + path_);
    }

    persist({});
    return true;
}

std::vector<IdentityRecord> JsonRecordStore::load() const {
    std::vector<IdentityRecord> records;
    std::string problem;
    if (read(records, problem) == ReadStatus::CORRUPT) {
        reportCorruption(path_, problem);
        return {};
    }
    return records;
}

void JsonRecordStore::persist(const std::vector<IdentityRecord>& records) {
    // Never overwrite an unreadable store; keep its bytes for manual recovery
    std::vector<IdentityRecord> current;
    std::string problem;
    if (read(current, problem) == ReadStatus::CORRUPT) {
        moveCorruptFileAside(problem);
    }

    json users = json::array();
    for (const auto& record : records) {
        users.push_back(recordToJson(record));
    }

    json document;
    document["users"] = std::move(users);

    utils::writeFileAtomically(path_, document.dump(2));
    utils::Logger::debug("Persisted " + std::to_string(records.size()) + " record(s) to " + path_);
}

void JsonRecordStore::moveCorruptFileAside(const std::string& problem) {
    std::error_code ec;
    if (!fs::is_regular_file(path_, ec)) {
        throw utils::StorageException("Record store path is not a regular file", path_);
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string backupPath = path_ + ".corrupt-" + std::to_string(seconds);

    for (int suffix = 1; fs::exists(backupPath, ec); ++suffix) {
        backupPath = path_ + ".corrupt-" + std::to_string(seconds) + "-" + std::to_string(suffix);
    }

    fs::rename(path_, backupPath, ec);
    if (ec) {
        throw utils::StorageException("Cannot move corrupt record store aside (" +
                                      ec.message() + ")", path_);
    }
    utils::Logger::warn("Corrupt record store moved to " + backupPath + ": " + problem);
}

JsonRecordStore::ReadStatus JsonRecordStore::read(std::vector<IdentityRecord>& records,
                                                  std::string& problem) const {
    records.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return ReadStatus::MISSING;
    }

    if (fs::is_directory(path_, ec)) {
        problem = "path is a directory";
        return ReadStatus::CORRUPT;
    }

    std::string content;
    if (!utils::readFile(path_, content)) {
        problem = "file cannot be opened";
        return ReadStatus::CORRUPT;
    }

    json document = json::parse(content, nullptr, false);
    if (document.is_discarded()) {
        problem = "malformed JSON";
        return ReadStatus::CORRUPT;
    }

    const json* users = nullptr;
    if (document.is_object()) {
        auto it = document.find("users");
        if (it == document.end()) {
            return ReadStatus::OK;
        }
        users = &*it;
    } else {
        users = &document;
    }

    if (!users->is_array()) {
        problem = "user listing is not an array";
        return ReadStatus::CORRUPT;
    }

    try {
        for (const auto& entry : *users) {
            records.push_back(recordFromJson(entry));
        }
    } catch (const std::exception& e) {
        records.clear();
        problem = e.what();
        return ReadStatus::CORRUPT;
    }

    return ReadStatus::OK;
}

} // namespace identity
} // namespace voiceguard
