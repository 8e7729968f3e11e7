#ifndef HITL_STORAGE_SECURE_FILE_H
#define HITL_STORAGE_SECURE_FILE_H

#include <string>

#include "hitl/core/compat.h"

/**
 * @file secure_file.h
 * @brief Owner-only file storage for credentials and key material
 *
 * Every failure raises HitlError(PERMISSION_ERROR) carrying the path and
 * errno text.
 */

namespace hitl {
namespace storage {

// Creates the directory (and parents) with mode 0700, tightens it if looser
void ensureDirectory(const std::string& dir);

/**
 * @brief Replace a file atomically
 *
 * Content goes to a 0600 temp file in the same directory which is synced and
 * renamed over the target; readers see either the old or the new content.
 */
void writeAtomic(const std::string& path, const std::string& content);

/**
 * @brief Create a file only if it does not exist yet
 *
 * The temp file is hard-linked into place, so concurrent writers cannot
 * overwrite each other.
 * @return false if the file already existed (content untouched)
 */
bool writeOnce(const std::string& path, const std::string& content);

/**
 * @brief Read a file
 * @param require_private reject files with any group/other permission bit
 * @return nullopt when the file does not exist
 */
optional<std::string> readFile(const std::string& path,
                               bool require_private = true);

// Returns false when there was nothing to remove
bool removeFile(const std::string& path);

bool fileExists(const std::string& path);

// Permission bits of an existing file, -1 when missing
int fileMode(const std::string& path);

}  // namespace storage
}  // namespace hitl

#endif  // HITL_STORAGE_SECURE_FILE_H
