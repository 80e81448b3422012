#pragma once

#include "job.h"
#include "process_runner.h"
#include <string>
#include <vector>

namespace cverify {

struct VerifierConfig;

struct PostProcessResult {
    bool ok = false;
    std::string artifact_path;  // File whose bytes are compared
    std::string error;
};

// Optional strip of the build artifact with wabt or wasm-tools
class PostProcessor {
public:
    explicit PostProcessor(const VerifierConfig& config, const ProcessLimits& limits = ProcessLimits{});

    // Expects <output_dir>/build.wasm to exist
    PostProcessResult run(StripTool tool, const std::string& output_dir);

    // Argument vector for a strip tool; empty for StripTool::NONE
    std::vector<std::string> strip_command(StripTool tool, const std::string& input,
                                           const std::string& output) const;

private:
    std::string wasm_strip_;
    std::string wasm_tools_;
    ProcessRunner runner_;
};

} // namespace cverify
