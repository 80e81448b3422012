#pragma once

#include "config.h"
#include "job.h"
#include "job_store.h"
#include "source_acquirer.h"
#include "sandbox_executor.h"
#include "post_processor.h"
#include "submission.h"
#include "worker_identity.h"
#include <string>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>

namespace cverify {

struct VerifierStats {
    uint64_t worker_starts = 0;
    uint64_t jobs_processed = 0;  // Jobs that reached a terminal status
    uint64_t backoffs = 0;
};

// Drives queued jobs through acquisition, build, strip, comparison and
// finalisation, one at a time, oldest first.
//
// notify() never blocks: the first call starts the worker thread, later
// calls leave a single pending wake-up however many arrive while it is busy.
class Verifier {
public:
    // identity may be null; success records are then unsigned
    Verifier(const VerifierConfig& config,
             JobStore& store,
             SourceAcquirer& acquirer,
             SandboxExecutor& sandbox,
             PostProcessor& post_processor,
             const WorkerIdentity* identity = nullptr);
    ~Verifier();

    Verifier(const Verifier&) = delete;
    Verifier& operator=(const Verifier&) = delete;

    void notify();

    // Interrupts backoff sleeps and joins the worker; a running build is
    // allowed to finish first
    void stop();

    // Creates the job PENDING (upload) or QUEUED (repository); throws StoreError
    AdmissionDecision submit(VerificationJob job);

    UploadCheck add_source_file(const SourceFile& file);

    // PENDING -> QUEUED once at least one file exists, then notify()
    CompleteCheck complete_upload(const std::string& address);

    VerifierStats stats() const;

    // True when the worker has nothing left to do
    bool idle() const;
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    enum class StepResult { DONE, RETRY };

    struct JobOutcome {
        StepResult step = StepResult::DONE;
        std::chrono::milliseconds backoff{0};
    };

    void worker_loop();
    void drain();
    JobOutcome process(const VerificationJob& job);
    void finish(const VerificationJob& job, JobStatus status);
    void finish_success(const VerificationJob& job, const std::string& content_id,
                        const std::vector<uint8_t>& artifact, const AcquireResult& acquired);
    bool sleep_backoff(std::chrono::milliseconds duration);

    const VerifierConfig& config_;
    JobStore& store_;
    SourceAcquirer& acquirer_;
    SandboxExecutor& sandbox_;
    PostProcessor& post_processor_;
    const WorkerIdentity* identity_;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
    bool started_ = false;
    bool wake_pending_ = false;
    bool busy_ = false;
    bool stopping_ = false;

    // Consecutive transient failures per address
    std::map<std::string, int> attempts_;

    std::atomic<uint64_t> worker_starts_{0};
    std::atomic<uint64_t> jobs_processed_{0};
    std::atomic<uint64_t> backoffs_{0};
};

} // namespace cverify
