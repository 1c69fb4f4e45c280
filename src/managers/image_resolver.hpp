#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// Legacy option that stands in for a current one
struct DeprecatedAlias {
    const char* legacy_flag;
    const char* current_flag;
    std::optional<std::string> LaunchOptions::*legacy;
    std::optional<std::string> LaunchOptions::*current;
};

// Known legacy -> current option mappings
const std::vector<DeprecatedAlias>& deprecated_aliases();

// For every alias whose legacy field is set: emit a deprecation warning and,
// if the current field is absent or empty, copy the legacy value into it.
// Returns the warnings.
std::vector<std::string> apply_deprecated_aliases(LaunchOptions& opts);

struct ImageResolution {
    std::optional<std::string> image;
    std::vector<std::string> warnings;
};

// head_image wins; pod_image is only a fallback, but always warns when set.
ImageResolution resolve_image(const std::optional<std::string>& head_image,
                              const std::optional<std::string>& pod_image);
