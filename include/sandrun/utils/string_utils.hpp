/**
 * @file string_utils.hpp
 * @brief String helpers for captured interpreter output and docker CLI text
 *
 * Small set of static helpers used when shaping captured stdout/stderr and
 * when reading the plain-text output of the docker command-line client.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace sandrun {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * std::string cmd = StringUtils::Join(argv, " ");
 * std::string id = StringUtils::Trim(docker_output);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of non-empty substrings
     *
     * **Example**:
     * @code
     * auto lines = StringUtils::Split("WARNING: a\nWARNING: b\n", '\n');
     * // lines = ["WARNING: a", "WARNING: b"]
     * @endcode
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);
};

} // namespace utils
} // namespace sandrun
