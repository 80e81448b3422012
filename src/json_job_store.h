#pragma once

#include "job_store.h"
#include <string>
#include <sys/types.h>

namespace cverify {

// JobStore persisted as two JSON documents inside a directory:
//   jobs.json     { "<address>": {job document}, ... }
//   sources.json  [ {source file document}, ... ]
//
// The documents are shared with other processes (the submission API writes
// jobs, the daemon drains them). Every call holds flock(2) on store.lock,
// re-reads a document whose file changed since it was last seen, and
// replaces documents through a temp file + rename. Writers in other
// processes must take the same lock.
class JsonFileJobStore : public JobStore {
public:
    // Loads existing documents; throws StoreError if they cannot be parsed
    explicit JsonFileJobStore(const std::string& directory);
    ~JsonFileJobStore() override;

    JsonFileJobStore(const JsonFileJobStore&) = delete;
    JsonFileJobStore& operator=(const JsonFileJobStore&) = delete;

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
    using JobMap = std::map<std::string, VerificationJob>;
    using FileMap = std::map<std::string, std::map<std::string, SourceFile>>;

    // Identity of a document file as last read or written
    struct FileStamp {
        bool exists = false;
        ino_t inode = 0;
        off_t size = 0;
        int64_t mtime_ns = 0;

        bool operator==(const FileStamp& other) const;
        bool operator!=(const FileStamp& other) const { return !(*this == other); }
    };

    // Holds the inter-process lock for one call
    class FileLock {
    public:
        explicit FileLock(int fd);
        ~FileLock();
    private:
        int fd_;
    };

    static FileStamp stamp_of(const std::string& path);

    // Re-reads whichever document changed on disk
    void refresh();

    // Persist first; memory only changes once the document is on disk
    void commit_jobs(JobMap jobs);
    void commit_sources(FileMap files);

    std::string directory_;
    std::string jobs_path_;
    std::string sources_path_;
    int lock_fd_ = -1;

    std::mutex mutex_;
    JobMap jobs_;
    FileMap files_;
    FileStamp jobs_stamp_;
    FileStamp sources_stamp_;
};

} // namespace cverify
