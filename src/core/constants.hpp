#pragma once

#include <cstddef>

// ── Identity ────────────────────────────────────────────────
constexpr const char* KUBERUN_VERSION = "0.4.0";

// ── Run names ───────────────────────────────────────────────
constexpr const char* RESERVED_RUN_NAME  = "last";
constexpr int RUN_NAME_MAX_LENGTH        = 80;
constexpr int NAME_GENERATOR_MAX_TRIES   = 1000;  // minting attempts before giving up

// ── Pipeline ────────────────────────────────────────────────
constexpr const char* STDIN_PIPELINE     = "-";   // pipeline read from standard input

// ── Default head pod values ─────────────────────────────────
constexpr const char* DEFAULT_HEAD_IMAGE       = "nextflow/nextflow:23.10.0";
constexpr const char* DEFAULT_WORKFLOW_COMMAND = "nextflow";
constexpr const char* DEFAULT_KUBECTL          = "kubectl";
constexpr const char* POD_APP_LABEL            = "kuberun";
constexpr const char* HEAD_CONTAINER_NAME      = "head";
constexpr size_t LABEL_VALUE_MAX_LENGTH        = 63;

// ── Timeouts ────────────────────────────────────────────────
constexpr int POD_START_TIMEOUT_SECS     = 600;   // wait for head pod to leave Pending

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".kuberun";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* HISTORY_FILE_NAME  = "history.yaml";
constexpr const char* HISTORY_DISABLED_ENV = "KUBERUN_HISTORY_DISABLED";
