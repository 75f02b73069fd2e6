/**
 * @file AtomicFileWriter.hpp
 * @brief Crash-safe whole-file replacement.
 */

#pragma once
#include <string>

namespace shelfsense::infrastructure {

/**
 * @class AtomicFileWriter
 * @brief Writes content to a temp file beside the target, then renames it over the target.
 *
 * An interrupted write leaves either the old file or the new one, never a mix.
 */
class AtomicFileWriter {
public:
    /**
     * @brief Replaces the file at path with content.
     * @param filename Destination path; parent directories are created.
     * @param content Full file body.
     * @return false if any step failed (details are logged).
     */
    static bool Write(const std::string& filename, const std::string& content);
};

} // namespace shelfsense::infrastructure
