#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Returns a fresh path in the temp dir: <prefix>_<pid>_<random><suffix>.
// The file itself is not created.
std::filesystem::path temp_file(const std::string& prefix, const std::string& suffix = "");

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
