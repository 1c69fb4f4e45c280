#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
};

// Runs all checks needed before `kuberun run` on an already loaded config.
// Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const Config& config);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_kubectl(const Config& config);
