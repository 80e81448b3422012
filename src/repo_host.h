#pragma once

#include <string>
#include <optional>

namespace cverify {

enum class FetchStatus {
    OK,
    NOT_FOUND,    // 404: terminal
    MALFORMED,    // 2xx with a body we cannot use: terminal
    UNAVAILABLE   // Transport error or any other status: retried
};

struct RepoInfo {
    std::string default_branch;
    size_t size_kb = 0;
    std::optional<std::string> license;  // SPDX id
};

struct BranchInfo {
    std::string commit_sha;
};

template <typename T>
struct FetchResult {
    FetchStatus status = FetchStatus::UNAVAILABLE;
    T value{};
    std::string detail;  // For logs

    bool ok() const { return status == FetchStatus::OK; }
};

// Read-only view of a repository hosting service
class RepoHost {
public:
    virtual ~RepoHost() = default;

    virtual FetchResult<RepoInfo> repository(const std::string& repo) = 0;
    virtual FetchResult<BranchInfo> branch(const std::string& repo, const std::string& branch) = 0;

    // URL `git clone` accepts for the repository
    virtual std::string clone_url(const std::string& repo) const = 0;
};

} // namespace cverify
