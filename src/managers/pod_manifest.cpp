#include "pod_manifest.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

static constexpr const char* STDIN_SCRIPT_PATH = "/tmp/kuberun-stdin.nf";

static bool has_line(const std::string& text, const std::string& line) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string current = text.substr(start, end - start);
        if (!current.empty() && current.back() == '\r') current.pop_back();
        if (current == line) return true;
        start = end + 1;
    }
    return false;
}

std::string heredoc_marker(const std::string& script) {
    std::string marker = "KUBERUN_EOF";
    for (int n = 1; has_line(script, marker); n++) {
        marker = fmt::format("KUBERUN_EOF_{}", n);
    }
    return marker;
}

std::string label_value(const std::string& value) {
    std::string out = value.substr(0, LABEL_VALUE_MAX_LENGTH);
    while (!out.empty() && (out.back() == '-' || out.back() == '_' || out.back() == '.')) {
        out.pop_back();
    }
    return out;
}

std::pair<std::string, std::string> parse_volume_mount(const std::string& mount) {
    auto colon = mount.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == mount.size()) {
        throw std::invalid_argument(
            fmt::format("Not a valid volume mount: `{}` -- expected claim:path", mount));
    }
    return {mount.substr(0, colon), mount.substr(colon + 1)};
}

std::string build_head_command(const std::string& pipeline,
                               const std::vector<std::string>& script_args,
                               const LaunchConfig& launch,
                               const Config& config,
                               const std::string& stdin_script) {
    std::string cmd;

    if (!launch.prescript().empty()) {
        cmd += launch.prescript() + " && ";
    }

    std::string target = pipeline;
    if (pipeline == STDIN_PIPELINE && !stdin_script.empty()) {
        // Quoted delimiter: the script body is not expanded by the shell
        std::string marker = heredoc_marker(stdin_script);
        cmd = fmt::format("cat > {} <<'{}'\n{}\n{}\n{}",
                          STDIN_SCRIPT_PATH, marker, stdin_script, marker, cmd);
        target = STDIN_SCRIPT_PATH;
    }

    std::vector<std::string> argv = {
        config.workflow_command(), "run", target, "-name", launch.run_name()
    };
    for (const auto& c : launch.remote_config()) {
        argv.push_back("-c");
        argv.push_back(c);
    }
    if (!launch.remote_profile().empty()) {
        argv.push_back("-profile");
        argv.push_back(launch.remote_profile());
    }
    argv.insert(argv.end(), script_args.begin(), script_args.end());

    cmd += shell_join(argv);
    return cmd;
}

YAML::Node build_pod_manifest(const std::string& pipeline,
                              const std::vector<std::string>& script_args,
                              const LaunchConfig& launch,
                              const Config& config,
                              const std::string& stdin_script) {
    YAML::Node pod;
    pod["apiVersion"] = "v1";
    pod["kind"] = "Pod";

    YAML::Node meta;
    meta["name"] = launch.run_name();
    if (!launch.namespace_name().empty()) {
        meta["namespace"] = launch.namespace_name();
    }
    meta["labels"]["app"] = POD_APP_LABEL;
    meta["labels"]["runName"] = label_value(launch.run_name());
    pod["metadata"] = meta;

    YAML::Node container;
    container["name"] = HEAD_CONTAINER_NAME;
    container["image"] = launch.image().value_or(config.head().image);
    container["command"].push_back(std::string("/bin/bash"));
    container["command"].push_back(std::string("-c"));
    container["command"].push_back(
        build_head_command(pipeline, script_args, launch, config, stdin_script));

    YAML::Node env;
    env["name"] = "NXF_ANSI_LOG";
    env["value"] = "false";
    container["env"].push_back(env);

    if (launch.cpus() > 0) {
        container["resources"]["requests"]["cpu"] = std::to_string(launch.cpus());
    }
    if (!launch.memory().empty()) {
        container["resources"]["requests"]["memory"] = launch.memory();
    }

    YAML::Node spec;
    spec["restartPolicy"] = "Never";
    if (!config.head().service_account.empty()) {
        spec["serviceAccountName"] = config.head().service_account;
    }

    int index = 0;
    for (const auto& mount : launch.volume_mounts()) {
        auto [claim, path] = parse_volume_mount(mount);
        std::string vol_name = fmt::format("vol-{}", ++index);

        YAML::Node vm;
        vm["name"] = vol_name;
        vm["mountPath"] = path;
        container["volumeMounts"].push_back(vm);

        YAML::Node vol;
        vol["name"] = vol_name;
        vol["persistentVolumeClaim"]["claimName"] = claim;
        spec["volumes"].push_back(vol);
    }

    spec["containers"].push_back(container);
    pod["spec"] = spec;
    return pod;
}
