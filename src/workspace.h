#pragma once

#include <string>
#include <stdexcept>

namespace cverify {

class WorkspaceError : public std::runtime_error {
public:
    explicit WorkspaceError(const std::string& message)
        : std::runtime_error("Workspace error: " + message) {}
};

// Working directory plus output directory for one job.
// Construction deletes and recreates the working directory and empties the
// output directory (throws WorkspaceError). Destruction deletes the working
// directory and empties the output directory again.
class ScopedWorkspace {
public:
    ScopedWorkspace(std::string src_dir, std::string output_dir);
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const std::string& src_dir() const { return src_dir_; }
    const std::string& output_dir() const { return output_dir_; }

private:
    std::string src_dir_;
    std::string output_dir_;
};

} // namespace cverify
