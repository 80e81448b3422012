#pragma once

#include "constants.h"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <memory>

namespace cverify {

// Limits applied to every host-side tool (git, chown, strip)
struct ProcessLimits {
    std::chrono::seconds timeout = std::chrono::seconds(TOOL_TIMEOUT_SECONDS);
    size_t max_memory_mb = TOOL_MEMORY_LIMIT_MB;
    size_t max_file_size_mb = TOOL_MAX_FILE_SIZE_MB;
    size_t max_open_files = TOOL_MAX_OPEN_FILES;
    bool seccomp = true;  // Deny kernel-admin syscalls in the child
};

struct ProcessResult {
    int exit_code = -1;          // Negative signal number when killed
    std::string stdout_output;
    std::string stderr_output;
    bool timed_out = false;
    std::string error_message;   // Set when the process could not be run at all

    bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

// Runs one command at a time: fork, rlimits, seccomp, execvp, wall-clock kill.
class ProcessRunner {
public:
    explicit ProcessRunner(const ProcessLimits& limits = ProcessLimits{});
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    // command[0] is looked up on PATH; working_dir empty = inherit
    ProcessResult run(const std::vector<std::string>& command,
                      const std::string& working_dir = "",
                      const std::map<std::string, std::string>& env = {});

    const ProcessLimits& limits() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cverify
