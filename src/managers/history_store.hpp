#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Record of past runs, queried when naming a new one.
// Implementations are expected to mint names atomically; callers do no locking.
class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    // False when no history is kept (names must then be given explicitly)
    virtual bool enabled() const = 0;

    virtual bool exists_by_name(const std::string& run_name) const = 0;

    // A fresh name not present in the history
    virtual std::string generate_next_name() = 0;

    virtual void record(const HistoryRecord& rec) = 0;
    virtual std::vector<HistoryRecord> records() const = 0;
};
