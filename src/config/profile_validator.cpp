/**
 * @file profile_validator.cpp
 * @brief openESPAT source file.
 */

#include "openespat/config/profile_validator.hpp"

#include <sstream>

namespace oea {
namespace {

constexpr std::size_t kMaxSsidLength = 32;
constexpr std::size_t kMaxPasswordLength = 63;

void checkChunkSize(const char* name, std::size_t value, std::vector<ValidationIssue>& issues) {
    if (value == 0U || value > AdapterOptions::kMaxChunkSize) {
        std::ostringstream os;
        os << name << " " << value << " outside range 1.." << AdapterOptions::kMaxChunkSize;
        issues.push_back({ValidationSeverity::Error, os.str()});
    }
}

} // namespace

std::vector<ValidationIssue> ProfileValidator::validate(const ModemProfile& profile) {
    std::vector<ValidationIssue> issues;

    if (profile.transport.empty()) {
        issues.push_back({ValidationSeverity::Error, "Transport spec cannot be empty"});
    }

    if (profile.ssid.empty()) {
        issues.push_back({ValidationSeverity::Warning, "SSID is empty"});
    } else if (profile.ssid.size() > kMaxSsidLength) {
        issues.push_back({ValidationSeverity::Error, "SSID longer than 32 bytes"});
    }
    if (profile.password.size() > kMaxPasswordLength) {
        issues.push_back({ValidationSeverity::Error, "Password longer than 63 bytes"});
    }

    checkChunkSize("txChunkSize", profile.options.txChunkSize, issues);
    checkChunkSize("rxChunkSize", profile.options.rxChunkSize, issues);

    if (profile.options.sendTimeout.count() <= 0) {
        issues.push_back({ValidationSeverity::Error, "sendTimeoutMs must be positive"});
    }
    if (profile.options.restartTimeout.count() <= 0) {
        issues.push_back({ValidationSeverity::Error, "restartTimeoutMs must be positive"});
    }
    if (profile.commandTimeoutMs <= 0) {
        issues.push_back({ValidationSeverity::Error, "commandTimeoutMs must be positive"});
    }
    if (profile.joinTimeoutMs < profile.commandTimeoutMs) {
        issues.push_back({ValidationSeverity::Warning, "joinTimeoutMs shorter than commandTimeoutMs"});
    }

    return issues;
}

bool ProfileValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace oea
