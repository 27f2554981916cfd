/**
 * @file types.cpp
 * @brief Helpers for pipeline data types
 *
 * @date 2025
 */

#include "sandrun/core/types.hpp"

namespace sandrun {
namespace core {

const char* TerminationToString(Termination termination) {
    switch (termination) {
        case Termination::NORMAL: return "normal";
        case Termination::RESOURCE_LIMIT: return "memory limit exceeded";
        case Termination::EXECUTION_ERROR: return "execution error";
        case Termination::INFRASTRUCTURE_ERROR: return "infrastructure error";
        default: return "unknown";
    }
}

} // namespace core
} // namespace sandrun
