#include "utils/file_utils.hpp"
#include "utils/error_handler.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>

namespace voiceguard {
namespace utils {

namespace fs = std::filesystem;

namespace {

bool syncPath(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

} // namespace

void writeFileAtomically(const std::string& path, const std::string& content) {
    const std::string tmpPath = path + ".tmp";

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StorageException("Cannot create directory " + parent.string() + " (" + ec.message() + ")", path);
        }
    }

    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageException("Cannot open temporary file for writing (" +
                                   std::string(std::strerror(errno)) + ")", tmpPath);
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ec;
            fs::remove(tmpPath, ec);
            throw StorageException("Failed to write temporary file", tmpPath);
        }
    }

    if (!syncPath(tmpPath, O_RDONLY)) {
        std::error_code ec;
        fs::remove(tmpPath, ec);
        throw StorageException("Failed to flush temporary file to disk", tmpPath);
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw StorageException("Failed to replace file (" + ec.message() + ")", path);
    }

    // Best effort: some filesystems refuse fsync on directories
    syncPath(parent.empty() ? std::string(".") : parent.string(), O_RDONLY | O_DIRECTORY);
}

bool readFile(const std::string& path, std::string& content) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    content = ss.str();
    return true;
}

} // namespace utils
} // namespace voiceguard
