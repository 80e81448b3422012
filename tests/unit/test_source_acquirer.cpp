#include <gtest/gtest.h>
#include "source_acquirer.h"
#include "test_support.h"
#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace cverify {
namespace {

using test::FakeGitClient;
using test::FakeRepoHost;

const std::string SHA = "4f2a9c1e8b7d6a5f4e3d2c1b0a9f8e7d6c5b4a39";

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class SourceAcquirerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "cverify_acquirer_test";
        std::filesystem::remove_all(test_dir);
        workdir = test_dir / "src";
        std::filesystem::create_directories(workdir);
        config.src_dir = workdir.string();
        config.output_dir = (test_dir / "out").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    VerificationJob upload_job(Language language) const {
        VerificationJob job;
        job.address = "vsc1Upload";
        job.source_kind = SourceKind::UPLOAD;
        job.toolchain.language = language;
        job.toolchain.compiler_version = "0.37.0";
        job.status = JobStatus::QUEUED;
        return job;
    }

    VerificationJob repo_job() const {
        VerificationJob job;
        job.address = "vsc1Repo";
        job.source_kind = SourceKind::REPOSITORY;
        job.repo_name = "vsc-eco/go-contract";
        job.toolchain.language = Language::GOLANG;
        job.toolchain.compiler_version = "0.37.0";
        job.status = JobStatus::QUEUED;
        return job;
    }

    AcquireResult acquire(const VerificationJob& job) {
        SourceAcquirer acquirer(config, store, host, git);
        return acquirer.acquire(job, workdir.string());
    }

    std::filesystem::path test_dir;
    std::filesystem::path workdir;
    VerifierConfig config;
    InMemoryJobStore store;
    FakeRepoHost host;
    FakeGitClient git;
};

// ============================================================================
// Uploaded sources
// ============================================================================

TEST_F(SourceAcquirerTest, UploadWritesSourcesUnderProfileSubdir) {
    // Given: a Go contract upload
    store.put_source_file({"vsc1Upload", "main.go", "package main", false});
    store.put_source_file({"vsc1Upload", "go.mod", "module contract", false});

    // When
    AcquireResult result = acquire(upload_job(Language::GOLANG));

    // Then: files land in ./contract and the rows are consumed
    ASSERT_EQ(result.outcome, AcquireOutcome::READY) << result.reason;
    EXPECT_EQ(read_text(workdir / "contract" / "main.go"), "package main");
    EXPECT_EQ(read_text(workdir / "contract" / "go.mod"), "module contract");
    EXPECT_EQ(store.count_source_files("vsc1Upload"), 0u);
    EXPECT_FALSE(result.commit.has_value());
}

TEST_F(SourceAcquirerTest, LockfileGoesToWorkdirRoot) {
    store.put_source_file({"vsc1Upload", "index.ts", "export function main(): void {}", false});
    store.put_source_file({"vsc1Upload", "pnpm-lock.yaml", "lockfileVersion: '9.0'", true});

    AcquireResult result = acquire(upload_job(Language::ASSEMBLYSCRIPT));

    ASSERT_EQ(result.outcome, AcquireOutcome::READY) << result.reason;
    EXPECT_TRUE(std::filesystem::exists(workdir / "assembly" / "index.ts"));
    EXPECT_TRUE(std::filesystem::exists(workdir / "pnpm-lock.yaml"));
    EXPECT_FALSE(std::filesystem::exists(workdir / "assembly" / "pnpm-lock.yaml"));
}

TEST_F(SourceAcquirerTest, AssemblyScriptUploadGetsPinnedPackageManifest) {
    // Given: an AssemblyScript upload with its own package.json and a lockfile
    VerificationJob job = upload_job(Language::ASSEMBLYSCRIPT);
    job.toolchain.dependencies = {
        {"@vsc.eco/sdk", "0.1.4"},
        {"assemblyscript", "0.27.31"},
        {"assemblyscript-json", "1.1.0"},
        {"@vsc.eco/contract-testing-utils", "0.1.5"}};
    store.put_source_file({"vsc1Upload", "index.ts", "export function main(): void {}", false});
    store.put_source_file({"vsc1Upload", "package.json", "{\"dependencies\": {}}", false});
    store.put_source_file({"vsc1Upload", "pnpm-lock.yaml", "lockfileVersion: '9.0'", true});

    // When
    AcquireResult result = acquire(job);

    // Then: pnpm finds a manifest at the working directory root
    ASSERT_EQ(result.outcome, AcquireOutcome::READY) << result.reason;
    ASSERT_TRUE(std::filesystem::exists(workdir / "package.json"));
    EXPECT_TRUE(std::filesystem::exists(workdir / "pnpm-lock.yaml"));

    Json::CharReaderBuilder builder;
    Json::Value manifest;
    std::string errors;
    std::istringstream in(read_text(workdir / "package.json"));
    ASSERT_TRUE(Json::parseFromStream(builder, in, &manifest, &errors)) << errors;

    const Json::Value& deps = manifest["dependencies"];
    ASSERT_TRUE(deps.isObject());
    EXPECT_EQ(deps.size(), 4u);
    EXPECT_EQ(deps["@vsc.eco/sdk"].asString(), "0.1.4");
    EXPECT_EQ(deps["assemblyscript"].asString(), "0.27.31");
    EXPECT_EQ(deps["assemblyscript-json"].asString(), "1.1.0");
    EXPECT_EQ(deps["@vsc.eco/contract-testing-utils"].asString(), "0.1.5");
}

TEST_F(SourceAcquirerTest, GoUploadHasNoPackageManifest) {
    store.put_source_file({"vsc1Upload", "main.go", "package main", false});

    ASSERT_EQ(acquire(upload_job(Language::GOLANG)).outcome, AcquireOutcome::READY);

    EXPECT_FALSE(std::filesystem::exists(workdir / "package.json"));
}

TEST_F(SourceAcquirerTest, UploadWithoutFilesFails) {
    AcquireResult result = acquire(upload_job(Language::GOLANG));

    EXPECT_EQ(result.outcome, AcquireOutcome::FAILED);
}

TEST_F(SourceAcquirerTest, UnsafeStoredNameFailsAndConsumesRows) {
    store.put_source_file({"vsc1Upload", "../escape.go", "package main", false});

    AcquireResult result = acquire(upload_job(Language::GOLANG));

    EXPECT_EQ(result.outcome, AcquireOutcome::FAILED);
    EXPECT_FALSE(std::filesystem::exists(workdir / "escape.go"));
    EXPECT_EQ(store.count_source_files("vsc1Upload"), 0u);
}

// ============================================================================
// Repository sources
// ============================================================================

TEST_F(SourceAcquirerTest, RepositoryClonesDefaultBranchHead) {
    // Given: repo metadata without an explicit branch on the job
    host.repo_responses = {FakeRepoHost::repo_ok("trunk", 100, std::string("MIT"))};
    host.branch_responses = {FakeRepoHost::branch_ok(SHA)};
    git.files = {{"contract/main.go", "package main"}};

    // When
    AcquireResult result = acquire(repo_job());

    // Then
    ASSERT_EQ(result.outcome, AcquireOutcome::READY) << result.reason;
    EXPECT_EQ(host.last_branch, "trunk");
    EXPECT_EQ(git.last_url, "https://example.invalid/vsc-eco/go-contract");
    EXPECT_EQ(git.last_commit, SHA);
    EXPECT_EQ(result.commit, std::optional<std::string>(SHA));
    EXPECT_EQ(result.license, std::optional<std::string>("MIT"));
    EXPECT_TRUE(std::filesystem::exists(workdir / "contract" / "main.go"));
}

TEST_F(SourceAcquirerTest, PinnedCommitAndBranch) {
    host.repo_responses = {FakeRepoHost::repo_ok()};
    host.branch_responses = {FakeRepoHost::branch_ok(SHA)};
    VerificationJob job = repo_job();
    job.repo_branch = "release";
    job.pinned_commit = "0123abcd";

    AcquireResult result = acquire(job);

    ASSERT_EQ(result.outcome, AcquireOutcome::READY);
    EXPECT_EQ(host.last_branch, "release");
    EXPECT_EQ(git.last_commit, "0123abcd");
    EXPECT_EQ(result.commit, std::optional<std::string>("0123abcd"));
}

TEST_F(SourceAcquirerTest, MissingRepositoryFails) {
    host.repo_responses = {FakeRepoHost::failure<RepoInfo>(FetchStatus::NOT_FOUND)};

    AcquireResult result = acquire(repo_job());

    EXPECT_EQ(result.outcome, AcquireOutcome::FAILED);
    EXPECT_EQ(git.clone_calls.load(), 0);
}

TEST_F(SourceAcquirerTest, MalformedMetadataFails) {
    host.repo_responses = {FakeRepoHost::repo_ok()};
    host.branch_responses = {FakeRepoHost::failure<BranchInfo>(FetchStatus::MALFORMED)};

    EXPECT_EQ(acquire(repo_job()).outcome, AcquireOutcome::FAILED);
}

TEST_F(SourceAcquirerTest, OversizedRepositoryFailsBeforeClone) {
    config.max_repo_size_kb = 1000;
    host.repo_responses = {FakeRepoHost::repo_ok("main", 1001)};
    host.branch_responses = {FakeRepoHost::branch_ok(SHA)};

    AcquireResult result = acquire(repo_job());

    EXPECT_EQ(result.outcome, AcquireOutcome::FAILED);
    EXPECT_EQ(host.branch_calls.load(), 0);
    EXPECT_EQ(git.clone_calls.load(), 0);
}

TEST_F(SourceAcquirerTest, HostUnavailableRetriesWithNetworkBackoff) {
    host.repo_responses = {FakeRepoHost::failure<RepoInfo>(FetchStatus::UNAVAILABLE)};

    AcquireResult result = acquire(repo_job());

    EXPECT_EQ(result.outcome, AcquireOutcome::RETRY);
    EXPECT_EQ(result.backoff, BackoffKind::NETWORK);
}

TEST_F(SourceAcquirerTest, CloneAndCheckoutFailuresRetryWithCloneBackoff) {
    host.repo_responses = {FakeRepoHost::repo_ok()};
    host.branch_responses = {FakeRepoHost::branch_ok(SHA)};

    git.fail_clone = true;
    AcquireResult clone_failed = acquire(repo_job());
    EXPECT_EQ(clone_failed.outcome, AcquireOutcome::RETRY);
    EXPECT_EQ(clone_failed.backoff, BackoffKind::CLONE);

    git.fail_clone = false;
    git.fail_checkout = true;
    AcquireResult checkout_failed = acquire(repo_job());
    EXPECT_EQ(checkout_failed.outcome, AcquireOutcome::RETRY);
    EXPECT_EQ(checkout_failed.backoff, BackoffKind::CLONE);
}

} // namespace
} // namespace cverify
