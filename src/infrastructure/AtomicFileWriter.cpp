/**
 * @file AtomicFileWriter.cpp
 * @brief Implementation of AtomicFileWriter.
 */

#include "infrastructure/AtomicFileWriter.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <thread>

namespace shelfsense::infrastructure {

namespace fs = std::filesystem;

bool AtomicFileWriter::Write(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Unique temp path: filename.<timestamp>.<thread>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::ostringstream suffix;
    suffix << "." << timestamp << "." << std::hash<std::thread::id>{}(std::this_thread::get_id()) << ".tmp";
    fs::path tempPath = finalPath;
    tempPath += suffix.str();

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[AtomicFileWriter] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[AtomicFileWriter] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[AtomicFileWriter] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[AtomicFileWriter] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace shelfsense::infrastructure
