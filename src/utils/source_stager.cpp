/**
 * @file source_stager.cpp
 * @brief Implementation of submission staging
 *
 * @date 2025
 */

#include "sandrun/utils/source_stager.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <random>

namespace sandrun {
namespace utils {

namespace fs = std::filesystem;

SourceStager::SourceStager(const std::string& code,
                           const std::string& entry_file,
                           const fs::path& base_directory)
    : entry_file_(entry_file) {

    if (entry_file_.empty() || fs::path(entry_file_).has_parent_path()) {
        throw StagingError("Entry file must be a plain file name: " + entry_file_);
    }

    std::error_code ec;
    fs::path base = fs::absolute(base_directory, ec);
    if (ec) {
        throw StagingError("Invalid staging directory: " + base_directory.string());
    }

    // create_directory reports false for an existing path; retry with a new name
    for (int attempt = 0; attempt < 8 && directory_.empty(); ++attempt) {
        fs::path candidate = base / GenerateDirectoryName();
        if (fs::create_directory(candidate, ec)) {
            directory_ = candidate;
        } else if (ec) {
            throw StagingError("Failed to create staging directory " + candidate.string() +
                               ": " + ec.message());
        }
    }
    if (directory_.empty()) {
        throw StagingError("Could not find a free staging directory under " + base.string());
    }

    fs::permissions(directory_,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    ec);
    if (ec) {
        spdlog::warn("Could not open up {}: {}", directory_.string(), ec.message());
    }

    fs::path entry_path = GetEntryPath();
    {
        std::ofstream out(entry_path, std::ios::binary);
        out << code;
        if (!out) {
            std::error_code cleanup_ec;
            fs::remove_all(directory_, cleanup_ec);
            throw StagingError("Failed to write " + entry_path.string());
        }
    }

    fs::permissions(entry_path,
                    fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read,
                    ec);
    if (ec) {
        spdlog::warn("Could not open up {}: {}", entry_path.string(), ec.message());
    }

    spdlog::debug("Staged {} bytes at {}", code.size(), entry_path.string());
}

SourceStager::~SourceStager() {
    if (directory_.empty()) {
        return;
    }

    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging directory {}: {}", directory_.string(), ec.message());
    }
}

std::string SourceStager::GenerateDirectoryName(const std::string& prefix) {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(100000, 999999);

    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" + std::to_string(dis(gen));
}

} // namespace utils
} // namespace sandrun
