#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>
#include "history_store.hpp"

// Validates a user-supplied run name or mints a new one from the history.
// The result is always normalized ('_' -> '-').
class RunNameResolver {
public:
    explicit RunNameResolver(HistoryStore& history);

    // An empty supplied name counts as absent.
    Result<std::string> resolve(const std::optional<std::string>& supplied,
                                bool cluster_bound);

private:
    HistoryStore& history_;
};
