#include "launch_orchestrator.hpp"
#include "image_resolver.hpp"
#include "run_name_resolver.hpp"
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <fmt/format.h>

LaunchOrchestrator::LaunchOrchestrator(HistoryStore& history, Driver& driver, StatusCallback warn)
    : history_(history), driver_(driver), warn_(std::move(warn)) {}

void LaunchOrchestrator::warn(const std::string& msg) {
    kuberun_log("WARN " + msg);
    if (warn_) warn_(msg);
}

Result<LaunchResult> LaunchOrchestrator::launch(const std::vector<std::string>& args,
                                       const LaunchOptions& options) {
    // ── Pipeline ────────────────────────────────────────────
    std::string pipeline;
    if (options.stdin_pipeline) {
        pipeline = STDIN_PIPELINE;
    } else if (!args.empty()) {
        pipeline = args[0];
    }
    if (pipeline.empty()) {
        return Result<LaunchResult>::Err(ErrorKind::MissingPipeline, "No project name was specified");
    }
    std::vector<std::string> script_args;
    if (args.size() > 1) {
        script_args.assign(args.begin() + 1, args.end());
    }

    if (options.ansi_log) {
        warn("Ansi logging not supported by kuberun command");
    }

    // ── Image ───────────────────────────────────────────────
    auto image = resolve_image(options.head_image, options.pod_image);
    for (const auto& w : image.warnings) {
        warn(w);
    }
    if (image.image && image.image->empty()) {
        image.image.reset();
    }

    // ── Run name ────────────────────────────────────────────
    RunNameResolver names(history_);
    auto run_name = names.resolve(options.run_name, true);
    if (run_name.is_err()) {
        kuberun_log("launch aborted: " + run_name.error);
        return Result<LaunchResult>::Err(run_name.kind, run_name.error);
    }

    // ── Config ──────────────────────────────────────────────
    LaunchConfig::Fields f;
    f.run_name = run_name.value;
    f.image = image.image;
    f.cpus = options.head_cpus;
    f.memory = options.head_memory;
    f.prescript = options.head_prescript;
    f.background = options.background;
    f.namespace_name = options.namespace_name;
    f.volume_mounts = options.volume_mounts;
    f.remote_config = options.remote_config;
    f.remote_profile = options.remote_profile;
    const LaunchConfig config(std::move(f));

    kuberun_log(fmt::format("launch: pipeline={} run_name={} image={} namespace={} background={}",
                            pipeline, config.run_name(), config.image().value_or("<default>"),
                            config.namespace_name(), config.background()));

    // ── Driver ──────────────────────────────────────────────
    // Driver failures propagate to the caller untouched.
    driver_.run(pipeline, script_args, config);
    int status = driver_.shutdown();

    kuberun_log(fmt::format("launch: {} finished with status {}", config.run_name(), status));
    LaunchResult result;
    result.status = status;
    result.run_name = config.run_name();
    return Result<LaunchResult>::Ok(result);
}
