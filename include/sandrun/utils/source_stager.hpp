/**
 * @file source_stager.hpp
 * @brief Stages submitted source code in a private host directory
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace sandrun {
namespace utils {

class StagingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class SourceStager
 * @brief Temporary directory holding one submission, removed on destruction
 *
 * The directory is created with a unique name under @p base_directory and
 * made world-readable, so the interpreter can read it through the read-only
 * bind mount whatever user the image runs as.
 *
 * **Usage Example**:
 * @code
 * SourceStager staged(code, "main.py");
 * auto result = pipeline.Run(staged.GetDirectory(), "/sandbox");
 * @endcode
 */
class SourceStager {
public:
    /**
     * @brief Write @p code to `<new temp dir>/<entry_file>`
     * @throws StagingError if the directory or file cannot be written
     */
    SourceStager(const std::string& code,
                 const std::string& entry_file,
                 const std::filesystem::path& base_directory = std::filesystem::temp_directory_path());

    ~SourceStager();

    SourceStager(const SourceStager&) = delete;
    SourceStager& operator=(const SourceStager&) = delete;

    const std::filesystem::path& GetDirectory() const { return directory_; }
    std::filesystem::path GetEntryPath() const { return directory_ / entry_file_; }

private:
    std::filesystem::path directory_;  ///< Staging directory (absolute)
    std::string entry_file_;           ///< File name inside directory_

    static std::string GenerateDirectoryName(const std::string& prefix = "sandrun");
};

} // namespace utils
} // namespace sandrun
