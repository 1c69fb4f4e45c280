#include "arg_parser.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <functional>

namespace {

using Setter = std::function<Result<void>(LaunchOptions&, const std::string&)>;

struct OptionSpec {
    std::vector<std::string> names;
    bool takes_value;
    bool hidden;
    std::string help;
    Setter set;
};

Result<void> ok() { return Result<void>::Ok(); }

const std::vector<OptionSpec>& option_table() {
    static const std::vector<OptionSpec> table = {
        {{"-v", "-volume-mount"}, true, false, "Volume claim mounts eg. my-pvc:/mnt/path",
         [](LaunchOptions& o, const std::string& v) { o.volume_mounts.push_back(v); return ok(); }},
        {{"-n", "-namespace"}, true, false, "Specify the K8s namespace to use",
         [](LaunchOptions& o, const std::string& v) { o.namespace_name = v; return ok(); }},
        {{"-head-image"}, true, false, "Specify the container image for the driver pod",
         [](LaunchOptions& o, const std::string& v) { o.head_image = v; return ok(); }},
        {{"-pod-image"}, true, false, "Alias for -head-image (deprecated)",
         [](LaunchOptions& o, const std::string& v) { o.pod_image = v; return ok(); }},
        {{"-head-cpus"}, true, false, "Specify number of CPUs requested for the driver pod",
         [](LaunchOptions& o, const std::string& v) {
             if (!parse_int(v, o.head_cpus) || o.head_cpus < 0) {
                 return Result<void>::Err(fmt::format("Invalid value for -head-cpus: `{}`", v));
             }
             return ok();
         }},
        {{"-head-memory"}, true, false, "Specify amount of memory requested for the driver pod",
         [](LaunchOptions& o, const std::string& v) { o.head_memory = v; return ok(); }},
        {{"-head-prescript"}, true, false, "Specify script to be run before the workflow starts",
         [](LaunchOptions& o, const std::string& v) { o.head_prescript = v; return ok(); }},
        {{"-remoteConfig"}, true, true, "Add the specified file from the K8s cluster to configuration set",
         [](LaunchOptions& o, const std::string& v) { o.remote_config.push_back(v); return ok(); }},
        {{"-remoteProfile"}, true, false, "Choose a configuration profile in the remoteConfig",
         [](LaunchOptions& o, const std::string& v) { o.remote_profile = v; return ok(); }},
        {{"-name"}, true, false, "Assign a mnemonic name to the pipeline run",
         [](LaunchOptions& o, const std::string& v) { o.run_name = v; return ok(); }},
        {{"-bg"}, false, false, "Submit the run and return without following it",
         [](LaunchOptions& o, const std::string&) { o.background = true; return ok(); }},
        {{"-ansi-log"}, true, false, "Enable/disable ANSI console logging (not supported)",
         [](LaunchOptions& o, const std::string& v) {
             if (v != "true" && v != "false") {
                 return Result<void>::Err(fmt::format("Invalid value for -ansi-log: `{}`", v));
             }
             o.ansi_log = true;
             return ok();
         }},
    };
    return table;
}

const OptionSpec* find_option(const std::string& name) {
    for (const auto& spec : option_table()) {
        for (const auto& n : spec.names) {
            if (n == name) return &spec;
        }
    }
    return nullptr;
}

} // namespace

Result<RunCommand> parse_run_args(const std::vector<std::string>& argv) {
    RunCommand cmd;

    for (size_t i = 0; i < argv.size(); i++) {
        const std::string& tok = argv[i];

        // Positional: pipeline, stdin marker, script args and --params
        if (tok == STDIN_PIPELINE) {
            if (cmd.args.empty()) cmd.options.stdin_pipeline = true;
            cmd.args.push_back(tok);
            continue;
        }
        if (tok.empty() || tok[0] != '-' || tok.rfind("--", 0) == 0) {
            cmd.args.push_back(tok);
            // --param value pairs travel together. The value may itself start
            // with '-' (`--offset -1`) unless it is a --param or a kuberun option.
            if (tok.rfind("--", 0) == 0 && tok.find('=') == std::string::npos &&
                i + 1 < argv.size()) {
                const std::string& next = argv[i + 1];
                if (next.rfind("--", 0) != 0 && !find_option(next)) {
                    cmd.args.push_back(argv[++i]);
                }
            }
            continue;
        }

        const OptionSpec* spec = find_option(tok);
        if (!spec) {
            return Result<RunCommand>::Err(fmt::format("Unknown option: {}", tok));
        }

        std::string value;
        if (spec->takes_value) {
            if (i + 1 >= argv.size()) {
                return Result<RunCommand>::Err(fmt::format("Missing value for option {}", tok));
            }
            value = argv[++i];
        }

        auto r = spec->set(cmd.options, value);
        if (r.is_err()) {
            return Result<RunCommand>::Err(r.error);
        }
    }

    return Result<RunCommand>::Ok(cmd);
}

std::string run_options_help() {
    std::string out;
    for (const auto& spec : option_table()) {
        if (spec.hidden) continue;
        std::string names;
        for (const auto& n : spec.names) {
            if (!names.empty()) names += ", ";
            names += n;
        }
        if (spec.takes_value) names += " <value>";
        out += fmt::format("    {:<28}{}\n", names, spec.help);
    }
    return out;
}
