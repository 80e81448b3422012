#include "git_client.h"
#include <iostream>

namespace cverify {

namespace {

// Commit ids are passed to git as arguments; refuse anything that could be an option
bool is_commit_id(const std::string& commit) {
    if (commit.empty() || commit.size() > 64) return false;
    for (char c : commit) {
        bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!hex) return false;
    }
    return true;
}

} // namespace

GitCli::GitCli(std::string git_binary, const ProcessLimits& limits)
    : git_binary_(std::move(git_binary)), runner_(limits) {}

GitResult GitCli::run(const std::vector<std::string>& args, const std::string& working_dir) {
    std::vector<std::string> command = {git_binary_};
    command.insert(command.end(), args.begin(), args.end());

    // Never prompt for credentials on a private or missing repository
    ProcessResult proc = runner_.run(command, working_dir, {{"GIT_TERMINAL_PROMPT", "0"}});

    GitResult result;
    result.ok = proc.ok();
    if (!result.ok) {
        result.error = !proc.error_message.empty() ? proc.error_message
                     : "git exited with " + std::to_string(proc.exit_code) + ": " + proc.stderr_output;
    }
    return result;
}

GitResult GitCli::clone(const std::string& url, const std::string& directory) {
    std::cout << "[Acquirer] git clone " << url << std::endl;
    return run({"clone", "--quiet", "--", url, directory}, "");
}

GitResult GitCli::checkout(const std::string& directory, const std::string& commit) {
    if (!is_commit_id(commit)) {
        return {false, "not a commit id: " + commit};
    }
    std::cout << "[Acquirer] git checkout " << commit << std::endl;
    return run({"-c", "advice.detachedHead=false", "checkout", "--quiet", "--detach", commit}, directory);
}

} // namespace cverify
