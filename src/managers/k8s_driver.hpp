#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/config.hpp>
#include <core/types.hpp>
#include "driver.hpp"

// Runs the workflow in a head pod created through kubectl.
class K8sDriver : public Driver {
public:
    explicit K8sDriver(const Config& config, StatusCallback cb = nullptr);

    void run(const std::string& pipeline,
             const std::vector<std::string>& script_args,
             const LaunchConfig& launch) override;

    // 0 in background mode, else the head container's exit code (1 if unknown)
    int shutdown() override;

private:
    const Config& config_;
    StatusCallback cb_;
    std::string pod_name_;
    std::string namespace_;
    bool background_ = false;

    // kubectl argv prefix with -n <ns> when a namespace is set
    std::vector<std::string> kubectl_args(std::vector<std::string> args) const;

    // Shell command for capture_command()
    std::string kubectl_shell(const std::vector<std::string>& args) const;

    std::string pod_phase() const;
    void wait_for_start();
    void status(const std::string& msg) const;
};
