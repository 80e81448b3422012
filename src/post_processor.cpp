#include "post_processor.h"
#include "config.h"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cverify {

PostProcessor::PostProcessor(const VerifierConfig& config, const ProcessLimits& limits)
    : wasm_strip_(config.wasm_strip), wasm_tools_(config.wasm_tools), runner_(limits) {}

std::vector<std::string> PostProcessor::strip_command(StripTool tool, const std::string& input,
                                                      const std::string& output) const {
    switch (tool) {
        case StripTool::WABT:
            return {wasm_strip_, "-o", output, input};
        case StripTool::WASM_TOOLS:
            return {wasm_tools_, "strip", "-o", output, input};
        case StripTool::NONE:
            break;
    }
    return {};
}

PostProcessResult PostProcessor::run(StripTool tool, const std::string& output_dir) {
    PostProcessResult result;
    std::string input = (fs::path(output_dir) / BUILD_OUTPUT_FILE).string();

    if (!fs::is_regular_file(input)) {
        result.error = std::string(BUILD_OUTPUT_FILE) + " not found";
        return result;
    }
    if (tool == StripTool::NONE) {
        result.ok = true;
        result.artifact_path = input;
        return result;
    }

    std::string output = (fs::path(output_dir) / STRIPPED_OUTPUT_FILE).string();
    ProcessResult proc = runner_.run(strip_command(tool, input, output));
    if (!proc.ok()) {
        result.error = strip_tool_to_string(tool) + " failed: " +
            (proc.error_message.empty() ? "exit " + std::to_string(proc.exit_code) + " " + proc.stderr_output
                                        : proc.error_message);
        std::cerr << "[Strip] " << result.error << std::endl;
        return result;
    }
    if (!fs::is_regular_file(output)) {
        result.error = std::string(STRIPPED_OUTPUT_FILE) + " not found";
        std::cerr << "[Strip] " << result.error << std::endl;
        return result;
    }

    std::cout << "[Strip] " << strip_tool_to_string(tool) << " stripped "
              << fs::file_size(input) << " -> " << fs::file_size(output) << " bytes" << std::endl;
    result.ok = true;
    result.artifact_path = output;
    return result;
}

} // namespace cverify
