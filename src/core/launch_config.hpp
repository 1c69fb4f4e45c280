#pragma once

#include <string>
#include <vector>
#include <optional>

// Everything the driver needs to start one run. Built once per launch and
// never modified afterwards.
class LaunchConfig {
public:
    struct Fields {
        std::string run_name;
        std::optional<std::string> image;        // nullopt = driver default
        int cpus = 0;                            // 0 = no request
        std::string memory;
        std::string prescript;
        bool background = false;
        std::string namespace_name;
        std::vector<std::string> volume_mounts;  // "claim:path", unvalidated
        std::vector<std::string> remote_config;
        std::string remote_profile;
    };

    explicit LaunchConfig(Fields fields) : f_(std::move(fields)) {}

    const std::string& run_name() const { return f_.run_name; }
    const std::optional<std::string>& image() const { return f_.image; }
    int cpus() const { return f_.cpus; }
    const std::string& memory() const { return f_.memory; }
    const std::string& prescript() const { return f_.prescript; }
    bool background() const { return f_.background; }
    const std::string& namespace_name() const { return f_.namespace_name; }
    const std::vector<std::string>& volume_mounts() const { return f_.volume_mounts; }
    const std::vector<std::string>& remote_config() const { return f_.remote_config; }
    const std::string& remote_profile() const { return f_.remote_profile; }

private:
    const Fields f_;
};
