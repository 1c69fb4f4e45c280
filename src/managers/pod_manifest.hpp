#pragma once

#include <string>
#include <vector>
#include <utility>
#include <yaml-cpp/yaml.h>
#include <core/config.hpp>
#include <core/launch_config.hpp>

// Split "claim:path" into {claim, path}.
// Throws std::invalid_argument if either side is missing.
std::pair<std::string, std::string> parse_volume_mount(const std::string& mount);

// Heredoc delimiter that does not occur as a line of `script`.
std::string heredoc_marker(const std::string& script);

// Truncate to the 63-character label limit, dropping trailing separators.
std::string label_value(const std::string& value);

// Shell command run inside the head pod: optional prescript, then
// `<workflow_command> run <pipeline> -name <run> [-c f]... [-profile p] args...`.
// A non-empty stdin_script is written to a file first and run in place of "-".
std::string build_head_command(const std::string& pipeline,
                               const std::vector<std::string>& script_args,
                               const LaunchConfig& launch,
                               const Config& config,
                               const std::string& stdin_script = "");

// Pod manifest for the head pod
YAML::Node build_pod_manifest(const std::string& pipeline,
                              const std::vector<std::string>& script_args,
                              const LaunchConfig& launch,
                              const Config& config,
                              const std::string& stdin_script = "");
