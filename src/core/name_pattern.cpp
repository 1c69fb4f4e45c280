#include "name_pattern.hpp"
#include "constants.hpp"
#include <regex>
#include <algorithm>

static const std::regex& run_name_regex() {
    static const std::regex re(R"([a-z](?:[a-z\d]|[-_](?=[a-z\d])){0,79})",
                               std::regex::ECMAScript | std::regex::icase);
    return re;
}

static const std::regex& cluster_name_regex() {
    static const std::regex re(R"([a-z0-9]+(?:-[a-z0-9]+)*(?:\.[a-z0-9]+(?:-[a-z0-9]+)*)*)",
                               std::regex::ECMAScript);
    return re;
}

bool matches_run_name_grammar(const std::string& name) {
    if (name.empty() || name.size() > static_cast<size_t>(RUN_NAME_MAX_LENGTH)) return false;
    return std::regex_match(name, run_name_regex());
}

bool matches_cluster_resource_grammar(const std::string& name) {
    if (name.empty()) return false;
    return std::regex_match(name, cluster_name_regex());
}

std::string normalize_run_name(const std::string& name) {
    std::string out = name;
    std::replace(out.begin(), out.end(), '_', '-');
    return out;
}

const char* run_name_grammar_description() {
    return "^[a-z](?:[a-z\\d]|[-_](?=[a-z\\d])){0,79}$ (case-insensitive)";
}

const char* cluster_resource_grammar_description() {
    return "It can only contain lower case alphanumeric characters, '-' or '.', "
           "and must start and end with an alphanumeric character";
}
