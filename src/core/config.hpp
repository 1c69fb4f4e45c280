#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Defaults for the head pod, overridden by command-line options
struct HeadPodDefaults {
    std::string namespace_name;
    std::string image;
    int cpus = 0;
    std::string memory;
    std::string prescript;
    std::string service_account;
    std::vector<std::string> volume_mounts;
};

struct HistoryConfig {
    bool enabled = true;
    fs::path path;               // empty = ./.kuberun/history.yaml
};

class Config {
public:
    // Load global config from ~/.kuberun/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Load config from an explicit file (must exist)
    static Result<Config> load_file(const fs::path& path);

    // Accessors
    const HeadPodDefaults& head() const { return head_; }
    const HistoryConfig& history() const { return history_; }
    const std::string& kubectl() const { return kubectl_; }
    const std::string& workflow_command() const { return workflow_command_; }

    // History file location after applying defaults
    fs::path history_path() const;

    // True unless disabled in config or through KUBERUN_HISTORY_DISABLED
    bool history_enabled() const;

    // Fill options the user left unset from config values.
    // The image is not filled here: the driver falls back to head().image
    // so that the deprecated -pod-image can still apply.
    LaunchOptions apply_defaults(const LaunchOptions& opts) const;

public:
    Config();

private:
    HeadPodDefaults head_;
    HistoryConfig history_;
    std::string kubectl_;
    std::string workflow_command_;
};

// Helper to check if config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (never overwrites)
Result<void> create_default_global_config();
