#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

struct RunCommand {
    std::vector<std::string> args;   // pipeline (or "-") followed by script args
    LaunchOptions options;
};

// Parse the arguments following `kuberun run`.
// Options start with a single '-'; a lone "-" names stdin as the pipeline;
// "--name value" style tokens are workflow params and pass through in order.
Result<RunCommand> parse_run_args(const std::vector<std::string>& argv);

// Option summary for --help (hidden options omitted)
std::string run_options_help();
