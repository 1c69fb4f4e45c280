#include "platform.hpp"
#include <cstdlib>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path temp_file(const std::string& prefix, const std::string& suffix) {
    // pid + random for uniqueness
    static std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> dist(10000, 99999);
    return temp_dir() / (prefix + "_" + std::to_string(getpid()) + "_" +
                         std::to_string(dist(rng)) + suffix);
}

void sleep_ms(int ms) {
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
