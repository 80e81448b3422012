#include "sandbox_executor.h"
#include <iostream>

namespace cverify {

std::string sandbox_outcome_to_string(SandboxOutcome outcome) {
    switch (outcome) {
        case SandboxOutcome::COMPLETED: return "completed";
        case SandboxOutcome::CREATE_FAILED: return "create failed";
        case SandboxOutcome::START_FAILED: return "start failed";
        case SandboxOutcome::WAIT_FAILED: return "wait failed";
    }
    return "unknown";
}

SandboxExecutor::SandboxExecutor(const VerifierConfig& config, ContainerRuntime& runtime)
    : config_(config), runtime_(runtime) {}

ContainerSpec SandboxExecutor::build_spec(const Toolchain& toolchain) const {
    const ToolchainProfile& profile = config_.profile(toolchain.language);

    ContainerSpec spec;
    spec.name = config_.container_name;

    spec.image = profile.image;
    const std::string placeholder = "{version}";
    size_t pos = spec.image.find(placeholder);
    if (pos != std::string::npos) {
        spec.image.replace(pos, placeholder.size(), toolchain.compiler_version);
    }

    spec.command = {"timeout", std::to_string(config_.build_timeout_seconds)};
    spec.command.insert(spec.command.end(), profile.command.begin(), profile.command.end());

    spec.working_dir = profile.source_mount;
    spec.binds = {
        config_.effective_src_host_dir() + ":" + profile.source_mount,
        config_.effective_output_host_dir() + ":" + profile.output_mount
    };
    spec.memory_bytes = config_.memory_limit_bytes;
    spec.auto_remove = true;
    return spec;
}

SandboxResult SandboxExecutor::run(const Toolchain& toolchain) {
    SandboxResult result;
    ContainerSpec spec = build_spec(toolchain);

    // A container left behind by a crash would block the fixed name
    RuntimeStatus removed = runtime_.remove(spec.name);
    if (!removed.ok) {
        std::cerr << "[Sandbox] Could not remove stale " << spec.name << ": " << removed.error << std::endl;
    }

    if (config_.pull_images) {
        RuntimeStatus pulled = runtime_.pull(spec.image);
        if (!pulled.ok) {
            std::cerr << "[Sandbox] Pull of " << spec.image << " failed: " << pulled.error << std::endl;
        }
    }

    CreateResult created = runtime_.create(spec);
    if (!created.ok) {
        result.outcome = SandboxOutcome::CREATE_FAILED;
        result.error = created.error;
        std::cerr << "[Sandbox] Create failed for " << spec.image << ": " << created.error << std::endl;
        return result;
    }

    // Auto-remove deletes the container the moment it exits
    std::unique_ptr<ExitWatch> exit_watch = runtime_.watch(created.id, spec.auto_remove);

    RuntimeStatus started = runtime_.start(created.id);
    if (!started.ok) {
        result.outcome = SandboxOutcome::START_FAILED;
        result.error = started.error;
        std::cerr << "[Sandbox] Start failed: " << started.error << std::endl;
        // Auto-remove only fires for containers that ran
        RuntimeStatus cleanup = runtime_.remove(created.id);
        if (!cleanup.ok) {
            std::cerr << "[Sandbox] Could not remove " << created.id << ": " << cleanup.error << std::endl;
        }
        return result;
    }

    std::cout << "[Sandbox] Building with " << spec.image << " (timeout "
              << config_.build_timeout_seconds << "s)" << std::endl;

    WaitResult waited = exit_watch->wait();
    if (!waited.ok) {
        result.outcome = SandboxOutcome::WAIT_FAILED;
        result.error = waited.error;
        std::cerr << "[Sandbox] Wait failed: " << waited.error << std::endl;
        return result;
    }

    result.outcome = SandboxOutcome::COMPLETED;
    result.exit_code = waited.exit_code;
    std::cout << "[Sandbox] Compiler exited with status " << waited.exit_code << std::endl;
    return result;
}

} // namespace cverify
