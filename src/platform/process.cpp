#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap a child nobody waited for so it does not linger as a zombie
    if (pid_ > 0) {
        waitpid(pid_, nullptr, WNOHANG);
    }
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        // Child process
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    return handle;
}

int run_process(const std::string& program, const std::vector<std::string>& args) {
    auto handle = spawn(program, args);
    if (!handle.valid()) return 127;
    return handle.wait();
}

bool find_executable(const std::string& program) {
    namespace fs = std::filesystem;
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (!path) return false;

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

} // namespace platform
