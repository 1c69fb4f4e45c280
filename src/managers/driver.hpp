#pragma once

#include <string>
#include <vector>
#include <core/launch_config.hpp>

// Starts and supervises a run on the cluster.
// Errors are reported by throwing; callers do not interpret them.
class Driver {
public:
    virtual ~Driver() = default;

    // Blocks until the run is submitted (background) or has finished.
    virtual void run(const std::string& pipeline,
                     const std::vector<std::string>& script_args,
                     const LaunchConfig& config) = 0;

    // Finalize and return the run's exit status
    virtual int shutdown() = 0;
};
