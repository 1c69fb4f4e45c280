#pragma once

#include <string>
#include <random>
#include <functional>

// Mints "<adjective>-<scientist>" run names, e.g. "quirky-einstein".
// Word lists are lowercase letters only, so every name is cluster-safe.
class NameGenerator {
public:
    NameGenerator();
    explicit NameGenerator(unsigned seed);

    std::string next();

    // Draw names until `taken` rejects one; throws std::runtime_error after
    // NAME_GENERATOR_MAX_TRIES attempts.
    std::string next_unused(const std::function<bool(const std::string&)>& taken);

private:
    std::mt19937 rng_;
};
