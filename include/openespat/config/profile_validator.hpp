/**
 * @file profile_validator.hpp
 * @brief openESPAT source file.
 */

#pragma once

#include <string>
#include <vector>

#include "openespat/config/adapter_options.hpp"

namespace oea {

/**
 * @brief Severity level for profile validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One profile validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
};

/**
 * @brief Validates a `ModemProfile` before bring-up.
 *
 * Checks chunk-size bounds, timeouts, credential lengths and the transport spec.
 */
class ProfileValidator {
public:
    static std::vector<ValidationIssue> validate(const ModemProfile& profile);
    static bool hasErrors(const std::vector<ValidationIssue>& issues);
};

} // namespace oea
