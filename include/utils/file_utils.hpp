#pragma once

#include <string>

namespace voiceguard {
namespace utils {

/**
 * Replace the file at path with content so that readers see either the old
 * or the new content, never a mix: write <path>.tmp, fsync it, rename it over
 * path, then fsync the parent directory.
 * @throws StorageException on any failure; the temp file is removed
 */
void writeFileAtomically(const std::string& path, const std::string& content);

/**
 * Read the whole file into content.
 * @return false if the file does not exist or cannot be opened
 */
bool readFile(const std::string& path, std::string& content);

} // namespace utils
} // namespace voiceguard
