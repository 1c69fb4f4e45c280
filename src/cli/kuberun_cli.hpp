#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>

class KuberunCLI {
public:
    KuberunCLI();

    // `kuberun run ...`: returns the process exit status
    int run_launch(const std::vector<std::string>& argv, const std::string& command_line);

    // `kuberun log`: list past runs
    int run_log();

    // `kuberun config init`
    int run_config_init();

private:
    // Loads ~/.kuberun/config.yaml once; prints the error and returns false on failure
    bool require_config();

    std::optional<Config> config_;
};
