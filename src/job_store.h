#pragma once

#include "job.h"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace cverify {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error("Job store error: " + message) {}
};

// Document collections holding verification jobs and uploaded sources.
// Every call is atomic on its own; there is no cross-call transaction.
// Implementations throw StoreError when the backing store is unusable.
class JobStore {
public:
    virtual ~JobStore() = default;

    // Oldest QUEUED job by requested_at, ties broken by address
    virtual std::optional<VerificationJob> next_queued() = 0;

    virtual std::optional<VerificationJob> get_job(const std::string& address) = 0;

    // Insert or replace the job keyed by its address
    virtual void put_job(const VerificationJob& job) = 0;

    // Returns false when no job exists for the address
    virtual bool set_status(const std::string& address, JobStatus status) = 0;

    // Sets SUCCESS together with the verification metadata
    virtual bool record_success(const std::string& address, const SuccessRecord& record) = 0;

    virtual std::vector<SourceFile> source_files(const std::string& address) = 0;
    virtual size_t count_source_files(const std::string& address) = 0;

    // Insert or replace on (address, filename)
    virtual void put_source_file(const SourceFile& file) = 0;
    virtual void delete_source_files(const std::string& address) = 0;
};

// Picks the FIFO head from a set of jobs; shared by the store implementations
std::optional<VerificationJob> select_next_queued(const std::map<std::string, VerificationJob>& jobs);

class InMemoryJobStore : public JobStore {
public:
    std::optional<VerificationJob> next_queued() override;
    std::optional<VerificationJob> get_job(const std::string& address) override;
    void put_job(const VerificationJob& job) override;
    bool set_status(const std::string& address, JobStatus status) override;
    bool record_success(const std::string& address, const SuccessRecord& record) override;
    std::vector<SourceFile> source_files(const std::string& address) override;
    size_t count_source_files(const std::string& address) override;
    void put_source_file(const SourceFile& file) override;
    void delete_source_files(const std::string& address) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, VerificationJob> jobs_;
    // address -> filename -> file
    std::map<std::string, std::map<std::string, SourceFile>> files_;
};

// Applies a SuccessRecord to a job document
void apply_success(VerificationJob& job, const SuccessRecord& record);

} // namespace cverify
