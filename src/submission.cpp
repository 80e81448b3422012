#include "submission.h"
#include "config.h"
#include "content_id.h"
#include "file_utils.h"
#include "constants.h"

namespace cverify {

namespace {

AdmissionDecision decide(Admission admission, std::string reason = "") {
    return {admission, std::move(reason)};
}

bool is_name_part(const std::string& part) {
    if (part.empty() || part.size() > 100 || part == "." || part == "..") {
        return false;
    }
    for (char c : part) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

// owner/name
bool is_repo_name(const std::string& repo) {
    size_t slash = repo.find('/');
    if (slash == std::string::npos) return false;
    return is_name_part(repo.substr(0, slash)) && is_name_part(repo.substr(slash + 1));
}

bool is_hex(const std::string& value) {
    if (value.empty()) return false;
    for (char c : value) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!ok) return false;
    }
    return true;
}

} // namespace

std::string admission_to_string(Admission admission) {
    switch (admission) {
        case Admission::ACCEPT: return "accepted";
        case Admission::ALREADY_VERIFIED: return "already verified";
        case Admission::REJECT_ACTIVE: return "verification in progress";
        case Admission::REJECT_COOLDOWN: return "resubmitted too soon";
        case Admission::REJECT_UNSUPPORTED_TOOLCHAIN: return "unsupported toolchain";
        case Admission::REJECT_INVALID: return "invalid request";
    }
    return "unknown";
}

AdmissionDecision validate_submission(const VerificationJob& job, const VerifierConfig& config) {
    if (job.address.empty()) {
        return decide(Admission::REJECT_INVALID, "address is required");
    }
    try {
        decode_content_id(job.expected_content_id);
    } catch (const ContentIdError& e) {
        return decide(Admission::REJECT_INVALID, e.what());
    }

    const Toolchain& toolchain = job.toolchain;
    if (!config.supports(toolchain.language, toolchain.compiler_version)) {
        return decide(Admission::REJECT_UNSUPPORTED_TOOLCHAIN,
                      language_to_string(toolchain.language) + " " + toolchain.compiler_version);
    }
    for (const auto& dep : config.profile(toolchain.language).required_dependencies) {
        if (toolchain.dependencies.count(dep) == 0) {
            return decide(Admission::REJECT_INVALID, "missing required dependency " + dep);
        }
    }

    if (job.source_kind == SourceKind::REPOSITORY) {
        if (!is_repo_name(job.repo_name)) {
            return decide(Admission::REJECT_INVALID, "repository must be owner/name");
        }
        if (!job.pinned_commit.empty() && (!is_hex(job.pinned_commit) || job.pinned_commit.size() > 64)) {
            return decide(Admission::REJECT_INVALID, "pinned commit must be a hex commit id");
        }
    }
    return decide(Admission::ACCEPT);
}

AdmissionDecision evaluate_admission(const std::optional<VerificationJob>& existing,
                                     const std::string& expected_content_id,
                                     TimePoint now,
                                     std::chrono::seconds cooldown) {
    if (!existing) {
        return decide(Admission::ACCEPT);
    }

    switch (existing->status) {
        case JobStatus::PENDING:
            return decide(Admission::ACCEPT);
        case JobStatus::QUEUED:
        case JobStatus::IN_PROGRESS:
            return decide(Admission::REJECT_ACTIVE, "job is " + status_to_string(existing->status));
        case JobStatus::SUCCESS:
            if (existing->expected_content_id == expected_content_id) {
                return decide(Admission::ALREADY_VERIFIED);
            }
            return decide(Admission::ACCEPT);
        case JobStatus::FAILED:
        case JobStatus::NOT_MATCH:
            if (now - existing->requested_at < cooldown) {
                return decide(Admission::REJECT_COOLDOWN, "previous attempt ended " +
                              status_to_string(existing->status));
            }
            return decide(Admission::ACCEPT);
    }
    return decide(Admission::REJECT_INVALID, "unknown job status");
}

std::string upload_check_to_string(UploadCheck check) {
    switch (check) {
        case UploadCheck::OK: return "ok";
        case UploadCheck::NO_JOB: return "no verification request for this address";
        case UploadCheck::NOT_PENDING: return "job is not pending upload";
        case UploadCheck::NOT_UPLOAD_JOB: return "job builds from a repository";
        case UploadCheck::BAD_NAME: return "invalid filename";
        case UploadCheck::RESERVED_NAME: return "reserved filename";
        case UploadCheck::LOCKFILE_NOT_ALLOWED: return "lockfile not accepted for this language";
        case UploadCheck::TOO_LARGE: return "file exceeds size limit";
    }
    return "unknown";
}

bool is_lockfile_name(const std::string& filename) {
    return filename == "pnpm-lock.yaml" || filename == "pnpm-lock.yml";
}

UploadCheck check_source_file(const std::optional<VerificationJob>& job, const SourceFile& file) {
    if (!FileUtils::is_safe_filename(file.filename)) {
        return UploadCheck::BAD_NAME;
    }
    if (file.content.size() > MAX_SOURCE_FILE_SIZE) {
        return UploadCheck::TOO_LARGE;
    }
    if (!job) {
        return UploadCheck::NO_JOB;
    }
    if (job->status != JobStatus::PENDING) {
        return UploadCheck::NOT_PENDING;
    }
    if (job->source_kind != SourceKind::UPLOAD) {
        return UploadCheck::NOT_UPLOAD_JOB;
    }

    bool assemblyscript = job->toolchain.language == Language::ASSEMBLYSCRIPT;
    if (file.is_lockfile) {
        if (!assemblyscript) {
            return UploadCheck::LOCKFILE_NOT_ALLOWED;
        }
        if (!is_lockfile_name(file.filename)) {
            return UploadCheck::BAD_NAME;
        }
    } else if (assemblyscript && is_lockfile_name(file.filename)) {
        return UploadCheck::RESERVED_NAME;
    }
    return UploadCheck::OK;
}

std::string complete_check_to_string(CompleteCheck check) {
    switch (check) {
        case CompleteCheck::OK: return "ok";
        case CompleteCheck::NO_JOB: return "no verification request for this address";
        case CompleteCheck::NOT_PENDING: return "job is not pending upload";
        case CompleteCheck::NO_FILES: return "no source files were uploaded";
    }
    return "unknown";
}

CompleteCheck check_complete_upload(const std::optional<VerificationJob>& job, size_t file_count) {
    if (!job) {
        return CompleteCheck::NO_JOB;
    }
    if (job->status != JobStatus::PENDING) {
        return CompleteCheck::NOT_PENDING;
    }
    if (file_count < 1) {
        return CompleteCheck::NO_FILES;
    }
    return CompleteCheck::OK;
}

} // namespace cverify
