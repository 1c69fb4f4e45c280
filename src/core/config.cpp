#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

Config::Config()
    : kubectl_(DEFAULT_KUBECTL),
      workflow_command_(DEFAULT_WORKFLOW_COMMAND) {
    head_.image = DEFAULT_HEAD_IMAGE;
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# kuberun configuration
# Command-line options take precedence over the values below.

# Kubernetes namespace for the head pod (empty = kubectl context default)
namespace: ""

# Head pod defaults
head_image: "nextflow/nextflow:23.10.0"
head_cpus: 0                       # 0 = no explicit request
head_memory: ""                    # e.g. "2Gi"
head_prescript: ""
service_account: ""

# Volume claims mounted in the head pod (claim:path)
volume_mounts: []

# Executables
kubectl: "kubectl"
workflow_command: "nextflow"

# Run history (used to generate and de-duplicate run names)
history:
  enabled: true
  # path: ".kuberun/history.yaml"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

static HeadPodDefaults parse_head_defaults(const YAML::Node& root) {
    HeadPodDefaults head;
    head.namespace_name = root["namespace"].as<std::string>("");
    head.image = root["head_image"].as<std::string>(DEFAULT_HEAD_IMAGE);
    if (head.image.empty()) head.image = DEFAULT_HEAD_IMAGE;
    head.cpus = root["head_cpus"].as<int>(0);
    head.memory = root["head_memory"].as<std::string>("");
    head.prescript = root["head_prescript"].as<std::string>("");
    head.service_account = root["service_account"].as<std::string>("");

    // volume_mounts: accept a single string or a list
    if (root["volume_mounts"]) {
        if (root["volume_mounts"].IsSequence()) {
            head.volume_mounts = root["volume_mounts"].as<std::vector<std::string>>(
                std::vector<std::string>());
        } else if (root["volume_mounts"].IsScalar()) {
            head.volume_mounts.push_back(root["volume_mounts"].as<std::string>());
        }
    }
    return head;
}

static HistoryConfig parse_history_config(const YAML::Node& node) {
    HistoryConfig history;
    if (!node) return history;

    // Shorthand `history: false`
    if (node.IsScalar()) {
        history.enabled = node.as<bool>(true);
        return history;
    }
    history.enabled = node["enabled"].as<bool>(true);
    history.path = node["path"].as<std::string>("");
    return history;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Failed to parse config: top level must be a mapping");
        }

        config.head_ = parse_head_defaults(root);
        config.history_ = parse_history_config(root["history"]);
        config.kubectl_ = root["kubectl"].as<std::string>(DEFAULT_KUBECTL);
        config.workflow_command_ = root["workflow_command"].as<std::string>(DEFAULT_WORKFLOW_COMMAND);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

fs::path Config::history_path() const {
    if (!history_.path.empty()) {
        return history_.path;
    }
    return fs::current_path() / CONFIG_DIR_NAME / HISTORY_FILE_NAME;
}

bool Config::history_enabled() const {
    return history_.enabled && !env_flag_set(HISTORY_DISABLED_ENV);
}

LaunchOptions Config::apply_defaults(const LaunchOptions& opts) const {
    LaunchOptions out = opts;
    if (out.namespace_name.empty()) out.namespace_name = head_.namespace_name;
    if (out.head_cpus <= 0) out.head_cpus = head_.cpus;
    if (out.head_memory.empty()) out.head_memory = head_.memory;
    if (out.head_prescript.empty()) out.head_prescript = head_.prescript;
    if (out.volume_mounts.empty()) out.volume_mounts = head_.volume_mounts;
    return out;
}
