#include "k8s_driver.hpp"
#include "pod_manifest.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <chrono>

K8sDriver::K8sDriver(const Config& config, StatusCallback cb)
    : config_(config), cb_(std::move(cb)) {}

void K8sDriver::status(const std::string& msg) const {
    kuberun_log("driver: " + msg);
    if (cb_) cb_(msg);
}

std::vector<std::string> K8sDriver::kubectl_args(std::vector<std::string> args) const {
    if (!namespace_.empty()) {
        args.insert(args.begin(), {"-n", namespace_});
    }
    return args;
}

std::string K8sDriver::kubectl_shell(const std::vector<std::string>& args) const {
    return shell_quote(config_.kubectl()) + " " + shell_join(kubectl_args(args)) + " 2>/dev/null";
}

std::string K8sDriver::pod_phase() const {
    std::string out;
    if (!capture_command(kubectl_shell({"get", "pod", pod_name_, "-o", "jsonpath={.status.phase}"}), out)) {
        return "";
    }
    return out;
}

void K8sDriver::wait_for_start() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(POD_START_TIMEOUT_SECS);
    std::string last;
    while (std::chrono::steady_clock::now() < deadline) {
        std::string phase = pod_phase();
        if (phase != last) {
            status(fmt::format("Pod {} is {}", pod_name_, phase.empty() ? "unknown" : phase));
            last = phase;
        }
        if (phase == "Running" || phase == "Succeeded" || phase == "Failed") {
            return;
        }
        platform::sleep_ms(2000);
    }
    throw std::runtime_error(fmt::format("Timed out waiting for pod {} to start", pod_name_));
}

void K8sDriver::run(const std::string& pipeline,
                    const std::vector<std::string>& script_args,
                    const LaunchConfig& launch) {
    pod_name_ = launch.run_name();
    namespace_ = launch.namespace_name();
    background_ = launch.background();

    std::string stdin_script;
    if (pipeline == STDIN_PIPELINE) {
        stdin_script.assign(std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>());
    }

    YAML::Emitter out;
    out << build_pod_manifest(pipeline, script_args, launch, config_, stdin_script);

    auto manifest_path = platform::temp_file("kuberun_pod", ".yaml");
    {
        std::ofstream f(manifest_path);
        if (!f) {
            throw std::runtime_error("Failed to write pod manifest " + manifest_path.string());
        }
        f << out.c_str() << "\n";
    }

    auto create = kubectl_args({"create", "-f", manifest_path.string()});
    int rc = platform::run_process(config_.kubectl(), create);
    kuberun_log_cmd("create", config_.kubectl() + " " + shell_join(create), rc);
    std::error_code ec;
    std::filesystem::remove(manifest_path, ec);
    if (rc != 0) {
        throw std::runtime_error(fmt::format("Unable to create pod {} (kubectl exit status {})",
                                             pod_name_, rc));
    }
    status(fmt::format("Pod {} created", pod_name_));

    if (background_) {
        return;
    }

    wait_for_start();

    auto logs = kubectl_args({"logs", "-f", "pod/" + pod_name_});
    rc = platform::run_process(config_.kubectl(), logs);
    kuberun_log_cmd("logs", config_.kubectl() + " " + shell_join(logs), rc);
}

int K8sDriver::shutdown() {
    if (background_ || pod_name_.empty()) {
        return 0;
    }

    // The log stream can end before the pod phase is updated
    for (int i = 0; i < 30; i++) {
        std::string phase = pod_phase();
        if (phase == "Succeeded" || phase == "Failed") break;
        platform::sleep_ms(1000);
    }

    std::string code;
    bool ok = capture_command(kubectl_shell({"get", "pod", pod_name_, "-o",
        "jsonpath={.status.containerStatuses[0].state.terminated.exitCode}"}), code);
    int exit_code = 0;
    if (!ok || !parse_int(code, exit_code)) {
        kuberun_log(fmt::format("driver: unable to read exit status of {} ('{}')", pod_name_, code));
        return 1;
    }
    return exit_code;
}
