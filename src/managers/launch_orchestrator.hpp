#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/launch_config.hpp>
#include "driver.hpp"
#include "history_store.hpp"

// Outcome of a launch that reached the driver
struct LaunchResult {
    int status = 0;          // driver exit status, unchanged
    std::string run_name;    // resolved run name
};

// Validates a `run` request, builds its LaunchConfig and hands it to the driver.
class LaunchOrchestrator {
public:
    // warn receives non-fatal messages (unsupported flags, deprecations)
    LaunchOrchestrator(HistoryStore& history, Driver& driver, StatusCallback warn = nullptr);

    // args: positional arguments, pipeline first, then script arguments.
    // Returns the driver's exit status with the run name, or a validation
    // error (in which case the driver was never called). The LaunchConfig
    // only lives for the duration of the call.
    Result<LaunchResult> launch(const std::vector<std::string>& args, const LaunchOptions& options);

private:
    HistoryStore& history_;
    Driver& driver_;
    StatusCallback warn_;

    void warn(const std::string& msg);
};
