#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "history_store.hpp"
#include "name_generator.hpp"

namespace fs = std::filesystem;

// History kept as a YAML file, by default ./.kuberun/history.yaml.
// A disabled instance never touches the filesystem.
class HistoryFile : public HistoryStore {
public:
    HistoryFile(const fs::path& path, bool enabled);

    bool enabled() const override { return enabled_; }
    bool exists_by_name(const std::string& run_name) const override;
    std::string generate_next_name() override;
    void record(const HistoryRecord& rec) override;
    std::vector<HistoryRecord> records() const override;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    bool enabled_;
    NameGenerator names_;

    void save(const std::vector<HistoryRecord>& recs) const;
};
