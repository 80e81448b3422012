#pragma once

#include "repo_host.h"
#include "http_client.h"
#include <string>
#include <vector>

namespace cverify {

struct VerifierConfig;

class GithubClient : public RepoHost {
public:
    explicit GithubClient(const VerifierConfig& config);

    FetchResult<RepoInfo> repository(const std::string& repo) override;
    FetchResult<BranchInfo> branch(const std::string& repo, const std::string& branch) override;
    std::string clone_url(const std::string& repo) const override;

    // Response body parsing, separated from transport
    static FetchResult<RepoInfo> parse_repository(long status_code, const std::string& body);
    static FetchResult<BranchInfo> parse_branch(long status_code, const std::string& body);

    static FetchStatus classify(long status_code);

private:
    std::vector<std::string> headers() const;

    std::string api_url_;
    std::string clone_base_;
    std::string api_key_;
    std::string user_agent_;
    HttpClient http_;
};

} // namespace cverify
