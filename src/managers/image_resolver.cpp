#include "image_resolver.hpp"
#include <fmt/format.h>

const std::vector<DeprecatedAlias>& deprecated_aliases() {
    static const std::vector<DeprecatedAlias> aliases = {
        {"-pod-image", "-head-image", &LaunchOptions::pod_image, &LaunchOptions::head_image},
    };
    return aliases;
}

std::vector<std::string> apply_deprecated_aliases(LaunchOptions& opts) {
    std::vector<std::string> warnings;
    for (const auto& alias : deprecated_aliases()) {
        const auto& legacy = opts.*(alias.legacy);
        if (!legacy) continue;

        warnings.push_back(fmt::format("{} is deprecated (use {} instead)",
                                       alias.legacy_flag, alias.current_flag));

        auto& current = opts.*(alias.current);
        if (!current || current->empty()) {
            current = legacy;
        }
    }
    return warnings;
}

ImageResolution resolve_image(const std::optional<std::string>& head_image,
                              const std::optional<std::string>& pod_image) {
    LaunchOptions opts;
    opts.head_image = head_image;
    opts.pod_image = pod_image;

    ImageResolution res;
    res.warnings = apply_deprecated_aliases(opts);
    res.image = opts.head_image;
    return res;
}
