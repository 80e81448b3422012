#pragma once

#include "job.h"
#include <string>
#include <optional>
#include <chrono>

namespace cverify {

struct VerifierConfig;

enum class Admission {
    ACCEPT,
    ALREADY_VERIFIED,              // Success with the same content id: nothing to do
    REJECT_ACTIVE,                 // Queued or in progress
    REJECT_COOLDOWN,               // Failed/not match too recently
    REJECT_UNSUPPORTED_TOOLCHAIN,
    REJECT_INVALID
};

std::string admission_to_string(Admission admission);

struct AdmissionDecision {
    Admission admission = Admission::REJECT_INVALID;
    std::string reason;

    bool accepted() const { return admission == Admission::ACCEPT; }
};

// Shape checks that do not depend on the stored job
AdmissionDecision validate_submission(const VerificationJob& job, const VerifierConfig& config);

// Decision against the job currently stored for the address.
// A PENDING job may be replaced; FAILED/NOT_MATCH only after the cooldown
// counted from its requested_at; SUCCESS with the same content id
// short-circuits, with a different content id it is replaced.
AdmissionDecision evaluate_admission(const std::optional<VerificationJob>& existing,
                                     const std::string& expected_content_id,
                                     TimePoint now,
                                     std::chrono::seconds cooldown);

enum class UploadCheck {
    OK,
    NO_JOB,
    NOT_PENDING,
    NOT_UPLOAD_JOB,
    BAD_NAME,
    RESERVED_NAME,    // Lockfile names are only accepted as the lockfile
    LOCKFILE_NOT_ALLOWED,
    TOO_LARGE
};

std::string upload_check_to_string(UploadCheck check);

bool is_lockfile_name(const std::string& filename);

UploadCheck check_source_file(const std::optional<VerificationJob>& job, const SourceFile& file);

enum class CompleteCheck {
    OK,
    NO_JOB,
    NOT_PENDING,
    NO_FILES
};

std::string complete_check_to_string(CompleteCheck check);

CompleteCheck check_complete_upload(const std::optional<VerificationJob>& job, size_t file_count);

} // namespace cverify
