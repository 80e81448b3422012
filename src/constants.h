#pragma once

#include <cstddef>  // for size_t

namespace cverify {

// Container limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 2048ULL * 1024 * 1024;  // 2GB per build
constexpr int DEFAULT_BUILD_TIMEOUT_SECONDS = 10;                      // `timeout` wrapper inside the container
constexpr const char* DEFAULT_CONTAINER_NAME = "cverify-compiler";

// Repository limits
constexpr size_t MAX_REPO_SIZE_KB = 10240;                            // GitHub reports size in KB
constexpr int DEFAULT_SANDBOX_UID = 1000;
constexpr int DEFAULT_SANDBOX_GID = 1000;

// Retry policy
constexpr int NETWORK_BACKOFF_SECONDS = 600;                          // Host API unreachable or erroring
constexpr int CLONE_BACKOFF_SECONDS = 60;                             // Clone or checkout failed
constexpr int SUBMISSION_COOLDOWN_SECONDS = 3600;                     // Resubmission after failed/not match

// Upload limits
constexpr size_t MAX_FILENAME_LENGTH = 50;
constexpr size_t MAX_SOURCE_FILE_SIZE = 1024 * 1024;                  // 1MB per uploaded file

// Host-side tool limits (git, chown, strip)
constexpr int TOOL_TIMEOUT_SECONDS = 300;
constexpr size_t TOOL_MEMORY_LIMIT_MB = 2048;
constexpr size_t TOOL_MAX_FILE_SIZE_MB = 512;
constexpr size_t TOOL_MAX_OPEN_FILES = 1024;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;

// Build artifacts
constexpr const char* BUILD_OUTPUT_FILE = "build.wasm";
constexpr const char* STRIPPED_OUTPUT_FILE = "build-striped.wasm";

// Daemon
constexpr int DEFAULT_POLL_INTERVAL_SECONDS = 5;

} // namespace cverify
