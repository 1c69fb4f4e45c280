#pragma once

#include <string>
#include <vector>

namespace platform {

// Owning handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, -1 if it did not
    // exit normally or the handle is invalid.
    int wait();

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process searching PATH. stdout/stderr are inherited.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Spawn and wait. Returns the exit code; 127 if the program was not found.
int run_process(const std::string& program, const std::vector<std::string>& args);

// True if `program` resolves to an executable (absolute path or on PATH).
bool find_executable(const std::string& program);

} // namespace platform
