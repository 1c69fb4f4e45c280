#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>

// Failure categories surfaced to the user before anything is launched
enum class ErrorKind {
    None,
    Generic,
    MissingPipeline,
    InvalidClusterName,
    ReservedRunName,
    MalformedRunName,
    DuplicateRunName,
    MissingRunName,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Generic};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Generic};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Raw option values for `kuberun run`, as given on the command line.
// Unset strings stay empty/nullopt; head_cpus == 0 means "not requested".
struct LaunchOptions {
    std::vector<std::string> volume_mounts;      // "claim:path"
    std::string namespace_name;
    std::optional<std::string> head_image;
    std::optional<std::string> pod_image;        // deprecated alias of head_image
    int head_cpus = 0;
    std::string head_memory;
    std::string head_prescript;
    std::vector<std::string> remote_config;
    std::string remote_profile;
    std::optional<std::string> run_name;
    bool background = false;
    bool ansi_log = false;                       // -ansi-log given explicitly
    bool stdin_pipeline = false;                 // pipeline is read from stdin
};

// One entry of the run history
struct HistoryRecord {
    std::string timestamp;   // ISO timestamp of the launch
    std::string run_name;
    std::string pipeline;
    std::string namespace_name;
    int status = -1;         // driver exit status, -1 = unknown
    std::string command;     // command line as typed
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
