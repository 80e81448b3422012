#pragma once

#include "config.h"
#include "job.h"
#include "job_store.h"
#include "repo_host.h"
#include "git_client.h"
#include "process_runner.h"
#include <string>
#include <optional>

namespace cverify {

enum class AcquireOutcome {
    READY,   // Sources are in the working directory
    FAILED,  // Terminal for this job
    RETRY    // Transient; try the same job again after a backoff
};

enum class BackoffKind {
    NONE,
    NETWORK,  // Hosting API unreachable or erroring
    CLONE     // Clone or checkout failed
};

struct AcquireResult {
    AcquireOutcome outcome = AcquireOutcome::FAILED;
    BackoffKind backoff = BackoffKind::NONE;
    std::optional<std::string> commit;   // Commit actually checked out
    std::optional<std::string> license;  // SPDX id reported by the host
    std::string reason;                  // For logs
};

// package.json pinning the job's dependency versions
std::string package_manifest(const VerificationJob& job);

// Materialises a job's sources into the working directory
class SourceAcquirer {
public:
    SourceAcquirer(const VerifierConfig& config, JobStore& store, RepoHost& host, GitClient& git);

    AcquireResult acquire(const VerificationJob& job, const std::string& workdir);

private:
    AcquireResult acquire_upload(const VerificationJob& job, const std::string& workdir);
    AcquireResult acquire_repository(const VerificationJob& job, const std::string& workdir);

    // chown -R so the container's unprivileged user can read the tree
    bool fix_permissions(const std::string& workdir);

    const VerifierConfig& config_;
    JobStore& store_;
    RepoHost& host_;
    GitClient& git_;
    ProcessRunner runner_;
};

} // namespace cverify
