#include "source_acquirer.h"
#include "file_utils.h"
#include <json/json.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cverify {

namespace {

AcquireResult failed(const std::string& reason) {
    AcquireResult result;
    result.outcome = AcquireOutcome::FAILED;
    result.reason = reason;
    return result;
}

AcquireResult retry(BackoffKind backoff, const std::string& reason) {
    AcquireResult result;
    result.outcome = AcquireOutcome::RETRY;
    result.backoff = backoff;
    result.reason = reason;
    return result;
}

} // namespace

std::string package_manifest(const VerificationJob& job) {
    Json::Value root(Json::objectValue);
    root["name"] = "contract";
    root["private"] = true;
    root["dependencies"] = Json::Value(Json::objectValue);
    for (const auto& [name, version] : job.toolchain.dependencies) {
        root["dependencies"][name] = version;
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, root) + "\n";
}

SourceAcquirer::SourceAcquirer(const VerifierConfig& config, JobStore& store,
                               RepoHost& host, GitClient& git)
    : config_(config), store_(store), host_(host), git_(git) {}

AcquireResult SourceAcquirer::acquire(const VerificationJob& job, const std::string& workdir) {
    AcquireResult result = job.source_kind == SourceKind::UPLOAD
        ? acquire_upload(job, workdir)
        : acquire_repository(job, workdir);

    if (result.outcome == AcquireOutcome::READY && config_.fix_permissions &&
        !fix_permissions(workdir)) {
        return failed("chown of " + workdir + " failed");
    }
    return result;
}

AcquireResult SourceAcquirer::acquire_upload(const VerificationJob& job, const std::string& workdir) {
    std::vector<SourceFile> files = store_.source_files(job.address);
    if (files.empty()) {
        return failed("no uploaded source files");
    }

    const ToolchainProfile& profile = config_.profile(job.toolchain.language);
    fs::path source_root = fs::path(workdir) / profile.source_subdir;

    std::error_code ec;
    fs::create_directories(source_root, ec);
    if (ec) {
        return failed("cannot create " + source_root.string() + ": " + ec.message());
    }

    AcquireResult result;
    result.outcome = AcquireOutcome::READY;
    for (const auto& file : files) {
        if (!FileUtils::is_safe_filename(file.filename)) {
            result = failed("unsafe file name '" + file.filename + "'");
            break;
        }
        fs::path target = file.is_lockfile ? fs::path(workdir) / file.filename
                                           : source_root / file.filename;
        if (!FileUtils::write_file(target.string(), file.content)) {
            result = failed("cannot write " + target.string());
            break;
        }
    }

    // The pinned dependency set, not whatever the upload declared
    if (result.outcome == AcquireOutcome::READY && profile.package_manifest) {
        fs::path manifest = fs::path(workdir) / "package.json";
        if (!FileUtils::write_file(manifest.string(), package_manifest(job))) {
            result = failed("cannot write " + manifest.string());
        }
    }

    // Rows are single-use whatever the outcome
    store_.delete_source_files(job.address);

    if (result.outcome == AcquireOutcome::READY) {
        std::cout << "[Acquirer] Wrote " << files.size() << " uploaded files for "
                  << job.address << std::endl;
    }
    return result;
}

AcquireResult SourceAcquirer::acquire_repository(const VerificationJob& job, const std::string& workdir) {
    if (job.repo_name.empty()) {
        return failed("job has no repository");
    }

    auto repo = host_.repository(job.repo_name);
    switch (repo.status) {
        case FetchStatus::OK:
            break;
        case FetchStatus::NOT_FOUND:
            return failed("repository " + job.repo_name + " not found");
        case FetchStatus::MALFORMED:
            return failed("repository metadata unusable: " + repo.detail);
        case FetchStatus::UNAVAILABLE:
            return retry(BackoffKind::NETWORK, "repository metadata: " + repo.detail);
    }

    if (repo.value.size_kb > config_.max_repo_size_kb) {
        return failed("repository is " + std::to_string(repo.value.size_kb) +
                      " KB, limit is " + std::to_string(config_.max_repo_size_kb) + " KB");
    }

    std::string branch_name = job.repo_branch.empty() ? repo.value.default_branch : job.repo_branch;
    auto branch = host_.branch(job.repo_name, branch_name);
    switch (branch.status) {
        case FetchStatus::OK:
            break;
        case FetchStatus::NOT_FOUND:
            return failed("branch " + branch_name + " not found");
        case FetchStatus::MALFORMED:
            return failed("branch metadata unusable: " + branch.detail);
        case FetchStatus::UNAVAILABLE:
            return retry(BackoffKind::NETWORK, "branch metadata: " + branch.detail);
    }

    std::string commit = job.pinned_commit.empty() ? branch.value.commit_sha : job.pinned_commit;

    // git refuses to clone into a non-empty directory
    std::error_code ec;
    fs::remove_all(workdir, ec);
    if (ec) {
        return failed("cannot reset " + workdir + ": " + ec.message());
    }

    GitResult cloned = git_.clone(host_.clone_url(job.repo_name), workdir);
    if (!cloned.ok) {
        return retry(BackoffKind::CLONE, "clone: " + cloned.error);
    }
    GitResult checked_out = git_.checkout(workdir, commit);
    if (!checked_out.ok) {
        return retry(BackoffKind::CLONE, "checkout " + commit + ": " + checked_out.error);
    }

    AcquireResult result;
    result.outcome = AcquireOutcome::READY;
    result.commit = commit;
    result.license = repo.value.license;
    std::cout << "[Acquirer] " << job.repo_name << "@" << commit << " ready" << std::endl;
    return result;
}

bool SourceAcquirer::fix_permissions(const std::string& workdir) {
    std::string owner = std::to_string(config_.sandbox_uid) + ":" + std::to_string(config_.sandbox_gid);
    ProcessResult proc = runner_.run({"chown", "-R", owner, workdir});
    if (!proc.ok()) {
        std::cerr << "[Acquirer] chown " << owner << " " << workdir << " failed: "
                  << (proc.error_message.empty() ? proc.stderr_output : proc.error_message) << std::endl;
        return false;
    }
    return true;
}

} // namespace cverify
