#include "history_file.hpp"
#include <core/debug_log.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

HistoryFile::HistoryFile(const fs::path& path, bool enabled)
    : path_(path), enabled_(enabled) {}

std::vector<HistoryRecord> HistoryFile::records() const {
    std::vector<HistoryRecord> recs;

    if (!enabled_ || !fs::exists(path_)) {
        return recs;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_.string());

        if (root["runs"] && root["runs"].IsSequence()) {
            for (const auto& n : root["runs"]) {
                HistoryRecord r;
                r.timestamp = n["timestamp"].as<std::string>("");
                r.run_name = n["run_name"].as<std::string>("");
                r.pipeline = n["pipeline"].as<std::string>("");
                r.namespace_name = n["namespace"].as<std::string>("");
                r.status = n["status"].as<int>(-1);
                r.command = n["command"].as<std::string>("");
                if (!r.run_name.empty()) recs.push_back(r);
            }
        }
    } catch (const std::exception& e) {
        // Corrupted history file, treat as empty
        kuberun_log(fmt::format("history: ignoring unreadable {}: {}", path_.string(), e.what()));
        return {};
    }

    return recs;
}

bool HistoryFile::exists_by_name(const std::string& run_name) const {
    if (!enabled_) return false;
    for (const auto& r : records()) {
        if (r.run_name == run_name) return true;
    }
    return false;
}

std::string HistoryFile::generate_next_name() {
    if (!enabled_) {
        throw std::logic_error("Run history is disabled -- cannot generate a run name");
    }
    auto recs = records();
    return names_.next_unused([&recs](const std::string& name) {
        for (const auto& r : recs) {
            if (r.run_name == name) return true;
        }
        return false;
    });
}

void HistoryFile::record(const HistoryRecord& rec) {
    if (!enabled_) return;
    auto recs = records();
    recs.push_back(rec);
    save(recs);
}

void HistoryFile::save(const std::vector<HistoryRecord>& recs) const {
    fs::create_directories(path_.parent_path());

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "runs" << YAML::Value << YAML::BeginSeq;
    for (const auto& r : recs) {
        out << YAML::BeginMap;
        out << YAML::Key << "timestamp" << YAML::Value << r.timestamp;
        out << YAML::Key << "run_name" << YAML::Value << r.run_name;
        out << YAML::Key << "pipeline" << YAML::Value << r.pipeline;
        out << YAML::Key << "namespace" << YAML::Value << r.namespace_name;
        out << YAML::Key << "status" << YAML::Value << r.status;
        out << YAML::Key << "command" << YAML::Value << r.command;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    if (!fout) {
        throw std::runtime_error("Failed to write history file " + path_.string());
    }
    fout << out.c_str() << "\n";
}
