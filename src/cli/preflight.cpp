#include "preflight.hpp"
#include <platform/process.hpp>
#include <fmt/format.h>

std::vector<PreflightIssue> check_kubectl(const Config& config) {
    std::vector<PreflightIssue> issues;

    if (!platform::find_executable(config.kubectl())) {
        issues.push_back({
            fmt::format("kubectl not found: {}", config.kubectl()),
            "Install kubectl or set `kubectl:` in " + get_global_config_path().string()
        });
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const Config& config) {
    return check_kubectl(config);
}
