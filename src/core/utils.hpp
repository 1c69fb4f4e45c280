#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Strict integer parse: the whole string must be a base-10 integer.
bool parse_int(const std::string& s, int& out);

// True if the environment variable is set to something other than "", "0" or "false".
bool env_flag_set(const char* name);

// Quote a string for a POSIX shell: 'it'\''s'
std::string shell_quote(const std::string& s);

// Join with a single space, quoting each element.
std::string shell_join(const std::vector<std::string>& parts);

// Run a command through the shell and capture its stdout.
// Returns false if the command could not be started or exited non-zero.
bool capture_command(const std::string& cmd, std::string& out);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
