#include "run_name_resolver.hpp"
#include <core/name_pattern.hpp>
#include <core/constants.hpp>
#include <core/debug_log.hpp>
#include <fmt/format.h>

RunNameResolver::RunNameResolver(HistoryStore& history) : history_(history) {}

Result<std::string> RunNameResolver::resolve(const std::optional<std::string>& supplied,
                                             bool cluster_bound) {
    const bool given = supplied.has_value() && !supplied->empty();

    // The cluster grammar is checked on the raw name, before normalization and
    // before the generic grammar. "My_Run" is therefore rejected here although
    // "my-run" would pass. Keep this order: it is the observed behaviour.
    if (cluster_bound && given && !matches_cluster_resource_grammar(*supplied)) {
        return Result<std::string>::Err(ErrorKind::InvalidClusterName,
            fmt::format("Not a valid K8s pod name -- {}",
                        cluster_resource_grammar_description()));
    }

    if (given && *supplied == RESERVED_RUN_NAME) {
        return Result<std::string>::Err(ErrorKind::ReservedRunName,
            fmt::format("Not a valid run name: `{}`", RESERVED_RUN_NAME));
    }

    if (given && !matches_run_name_grammar(*supplied)) {
        return Result<std::string>::Err(ErrorKind::MalformedRunName,
            fmt::format("Not a valid run name: `{}` -- It must match the pattern {}",
                        *supplied, run_name_grammar_description()));
    }

    std::string name;
    if (!given) {
        if (!history_.enabled()) {
            return Result<std::string>::Err(ErrorKind::MissingRunName, "Missing workflow run name");
        }
        // Minted names are unique by construction
        name = history_.generate_next_name();
        kuberun_log(fmt::format("run name: generated {}", name));
    } else {
        if (history_.enabled() && history_.exists_by_name(*supplied)) {
            return Result<std::string>::Err(ErrorKind::DuplicateRunName,
                fmt::format("Run name `{}` has been already used -- Specify a different one",
                            *supplied));
        }
        name = *supplied;
    }

    return Result<std::string>::Ok(normalize_run_name(name));
}
