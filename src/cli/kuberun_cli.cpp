#include "kuberun_cli.hpp"
#include "arg_parser.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <managers/history_file.hpp>
#include <managers/k8s_driver.hpp>
#include <managers/launch_orchestrator.hpp>
#include <fmt/format.h>
#include <iostream>

KuberunCLI::KuberunCLI() = default;

bool KuberunCLI::require_config() {
    if (config_) return true;

    auto result = Config::load_global();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        std::cout << theme::step("Check YAML syntax in " + get_global_config_path().string());
        return false;
    }
    config_ = result.value;
    return true;
}

int KuberunCLI::run_launch(const std::vector<std::string>& argv, const std::string& command_line) {
    auto parsed = parse_run_args(argv);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        std::cout << theme::step("Run 'kuberun --help' for usage");
        return 1;
    }

    if (!require_config()) return 1;
    const Config& config = config_.value();

    auto issues = run_preflight_checks(config);
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            std::cout << theme::fail(issue.message);
            std::cout << theme::step(issue.fix);
        }
        return 1;
    }

    LaunchOptions options = config.apply_defaults(parsed.value.options);

    HistoryFile history(config.history_path(), config.history_enabled());
    auto print_status = [](const std::string& msg) {
        std::cout << theme::info(msg);
    };
    K8sDriver driver(config, print_status);
    LaunchOrchestrator orchestrator(history, driver, [](const std::string& msg) {
        std::cout << theme::warn(msg);
    });

    auto result = orchestrator.launch(parsed.value.args, options);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    // Record the run once the driver has finished
    if (history.enabled()) {
        HistoryRecord rec;
        rec.timestamp = now_iso();
        rec.run_name = result.value.run_name;
        rec.pipeline = options.stdin_pipeline ? STDIN_PIPELINE : parsed.value.args.front();
        rec.namespace_name = options.namespace_name;
        rec.status = options.background ? -1 : result.value.status;
        rec.command = command_line;
        try {
            history.record(rec);
        } catch (const std::exception& e) {
            std::cout << theme::warn(std::string("Unable to update run history: ") + e.what());
        }
    }

    return result.value.status;
}

int KuberunCLI::run_log() {
    if (!require_config()) return 1;
    const Config& config = config_.value();

    if (!config.history_enabled()) {
        std::cout << theme::info("Run history is disabled");
        return 0;
    }

    HistoryFile history(config.history_path(), true);
    auto records = history.records();
    if (records.empty()) {
        std::cout << theme::info("No runs recorded in " + history.path().string());
        return 0;
    }

    std::cout << theme::section("Runs");
    std::cout << theme::dim(fmt::format("    {:<20}{:<28}{:<8}{}", "TIMESTAMP", "RUN NAME",
                                        "STATUS", "PIPELINE")) << "\n";
    for (const auto& r : records) {
        std::string status = r.status < 0 ? "-" : std::to_string(r.status);
        std::cout << fmt::format("    {:<20}{:<28}{:<8}{}\n", r.timestamp, r.run_name,
                                 status, r.pipeline);
    }
    std::cout << "\n";
    return 0;
}

int KuberunCLI::run_config_init() {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
        return 0;
    }
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Created " + get_global_config_path().string());
    return 0;
}
