#pragma once

#include <cstddef>
#include <cstdint>

namespace flatpush::constants {

// Build service limits
constexpr size_t MISSING_OBJECTS_CHUNK = 2000;                   // ids per missing_objects request
constexpr uint64_t UPLOAD_CHUNK_LIMIT = 4 * 1024 * 1024;          // 4 MiB per upload request
constexpr size_t UPLOAD_READ_BLOCK = 64 * 1024;                   // 64 KiB file read block

// Retry defaults
constexpr unsigned RETRY_MAX_ELAPSED_SECONDS = 300;
constexpr unsigned RETRY_MAX_WAIT_SECONDS = 60;
constexpr double RETRY_MULTIPLIER = 1.0;

// Job polling
constexpr int JOB_POLL_MAX_ERRORS = 5;

// Tokens
constexpr uint64_t MINIMAL_TOKEN_DURATION_SECONDS = 60 * 60;       // 1 hour
constexpr uint64_t DEFAULT_TOKEN_DURATION_SECONDS = 24 * 60 * 60;  // 1 day
constexpr const char* MINIMAL_TOKEN_NAME = "minimal-upload";
constexpr const char* TOKEN_ENV_VAR = "REPO_TOKEN";

// HTTP defaults
constexpr const char* DEFAULT_USER_AGENT = "flatpush/1.0";
constexpr unsigned DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;
constexpr unsigned DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;

// Metrics
constexpr unsigned DEFAULT_METRICS_INTERVAL_SECONDS = 15;

}  // namespace flatpush::constants
