#pragma once

#include "process_runner.h"
#include <string>

namespace cverify {

struct GitResult {
    bool ok = false;
    std::string error;
};

class GitClient {
public:
    virtual ~GitClient() = default;

    // Clone url into directory (which must not exist or be empty)
    virtual GitResult clone(const std::string& url, const std::string& directory) = 0;

    // Detached checkout of an exact commit
    virtual GitResult checkout(const std::string& directory, const std::string& commit) = 0;
};

// Drives the `git` executable
class GitCli : public GitClient {
public:
    explicit GitCli(std::string git_binary = "git", const ProcessLimits& limits = ProcessLimits{});

    GitResult clone(const std::string& url, const std::string& directory) override;
    GitResult checkout(const std::string& directory, const std::string& commit) override;

private:
    GitResult run(const std::vector<std::string>& args, const std::string& working_dir);

    std::string git_binary_;
    ProcessRunner runner_;
};

} // namespace cverify
