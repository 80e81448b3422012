#include "job_store.h"

namespace cverify {

std::optional<VerificationJob> select_next_queued(const std::map<std::string, VerificationJob>& jobs) {
    const VerificationJob* best = nullptr;
    // std::map iterates by address, so the first job seen wins a timestamp tie
    for (const auto& [address, job] : jobs) {
        if (job.status != JobStatus::QUEUED) {
            continue;
        }
        if (!best || job.requested_at < best->requested_at) {
            best = &job;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

void apply_success(VerificationJob& job, const SuccessRecord& record) {
    job.status = JobStatus::SUCCESS;
    job.verified_at = record.verified_at;
    job.git_commit = record.git_commit;
    if (record.license) {
        job.license = record.license;
    }
    job.exports = record.exports;
    job.verifier_identity = record.verifier_identity;
    job.signature = record.signature;
}

std::optional<VerificationJob> InMemoryJobStore::next_queued() {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_next_queued(jobs_);
}

std::optional<VerificationJob> InMemoryJobStore::get_job(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(address);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryJobStore::put_job(const VerificationJob& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_[job.address] = job;
}

bool InMemoryJobStore::set_status(const std::string& address, JobStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(address);
    if (it == jobs_.end()) {
        return false;
    }
    it->second.status = status;
    return true;
}

bool InMemoryJobStore::record_success(const std::string& address, const SuccessRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(address);
    if (it == jobs_.end()) {
        return false;
    }
    apply_success(it->second, record);
    return true;
}

std::vector<SourceFile> InMemoryJobStore::source_files(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SourceFile> result;
    auto it = files_.find(address);
    if (it != files_.end()) {
        for (const auto& [name, file] : it->second) {
            result.push_back(file);
        }
    }
    return result;
}

size_t InMemoryJobStore::count_source_files(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(address);
    return it == files_.end() ? 0 : it->second.size();
}

void InMemoryJobStore::put_source_file(const SourceFile& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[file.address][file.filename] = file;
}

void InMemoryJobStore::delete_source_files(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_.erase(address);
}

} // namespace cverify
