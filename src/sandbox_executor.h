#pragma once

#include "config.h"
#include "container_runtime.h"
#include "job.h"
#include <string>
#include <cstdint>

namespace cverify {

enum class SandboxOutcome {
    COMPLETED,      // Container ran; see exit_code
    CREATE_FAILED,
    START_FAILED,
    WAIT_FAILED
};

struct SandboxResult {
    SandboxOutcome outcome = SandboxOutcome::CREATE_FAILED;
    int64_t exit_code = -1;
    std::string error;

    bool succeeded() const { return outcome == SandboxOutcome::COMPLETED && exit_code == 0; }
};

std::string sandbox_outcome_to_string(SandboxOutcome outcome);

// Runs one toolchain build in a throwaway container. The working directory
// is mounted at the profile's source mount and the output directory at its
// output mount; the command is wrapped in `timeout <seconds>`.
class SandboxExecutor {
public:
    SandboxExecutor(const VerifierConfig& config, ContainerRuntime& runtime);

    ContainerSpec build_spec(const Toolchain& toolchain) const;

    // Blocks until the container stops
    SandboxResult run(const Toolchain& toolchain);

private:
    const VerifierConfig& config_;
    ContainerRuntime& runtime_;
};

} // namespace cverify
