/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON result rendering
 *
 * @date 2025
 */

#include "sandrun/reporters/json_reporter.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sandrun {
namespace reporters {

namespace {

json ResultToJson(const core::ExecutionResult& result) {
    json j;
    j["stdout"] = result.stdout_output;
    j["stderr"] = result.stderr_output;
    j["exit_code"] = result.exit_code;
    j["stdout_truncated"] = result.stdout_truncated;
    j["stderr_truncated"] = result.stderr_truncated;
    return j;
}

std::string Dump(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // anonymous namespace

std::string JsonReporter::FormatResult(const core::ExecutionResult& result) const {
    return Dump(ResultToJson(result), indent_);
}

std::string JsonReporter::FormatError(const core::SandboxError& error) const {
    json j;
    j["error"] = core::TerminationToString(error.termination());
    j["message"] = error.what();
    if (error.captured()) {
        j["captured"] = ResultToJson(*error.captured());
    }
    return Dump(j, indent_);
}

} // namespace reporters
} // namespace sandrun
