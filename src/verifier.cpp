#include "verifier.h"
#include "content_id.h"
#include "wasm_exports.h"
#include "workspace.h"
#include "file_utils.h"
#include <iostream>

namespace cverify {

Verifier::Verifier(const VerifierConfig& config,
                   JobStore& store,
                   SourceAcquirer& acquirer,
                   SandboxExecutor& sandbox,
                   PostProcessor& post_processor,
                   const WorkerIdentity* identity)
    : config_(config),
      store_(store),
      acquirer_(acquirer),
      sandbox_(sandbox),
      post_processor_(post_processor),
      identity_(identity) {}

Verifier::~Verifier() {
    stop();
}

void Verifier::notify() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return;
    }
    wake_pending_ = true;
    if (!started_) {
        started_ = true;
        worker_starts_++;
        worker_ = std::thread(&Verifier::worker_loop, this);
    }
    wake_cv_.notify_one();
}

void Verifier::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

VerifierStats Verifier::stats() const {
    VerifierStats stats;
    stats.worker_starts = worker_starts_.load();
    stats.jobs_processed = jobs_processed_.load();
    stats.backoffs = backoffs_.load();
    return stats;
}

bool Verifier::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !busy_ && !wake_pending_;
}

bool Verifier::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return !busy_ && !wake_pending_; });
}

void Verifier::worker_loop() {
    std::cout << "[Verifier] Worker started" << std::endl;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_cv_.wait(lock, [this] { return wake_pending_ || stopping_; });
        if (stopping_) {
            break;
        }
        wake_pending_ = false;
        busy_ = true;

        lock.unlock();
        drain();
        lock.lock();

        busy_ = false;
        idle_cv_.notify_all();
    }
    busy_ = false;
    idle_cv_.notify_all();
    std::cout << "[Verifier] Worker stopped" << std::endl;
}

void Verifier::drain() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
        }

        std::optional<VerificationJob> job;
        try {
            job = store_.next_queued();
        } catch (const StoreError& e) {
            std::cerr << "[Verifier] Cannot query queue, halting: " << e.what() << std::endl;
            return;
        }
        if (!job) {
            return;
        }

        JobOutcome outcome;
        try {
            outcome = process(*job);
        } catch (const WorkspaceError& e) {
            std::cerr << "[Verifier] " << e.what() << ", halting" << std::endl;
            return;
        } catch (const StoreError& e) {
            // The job keeps whatever status was last persisted
            std::cerr << "[Verifier] Status write for " << job->address << " failed, halting: "
                      << e.what() << std::endl;
            return;
        }

        if (outcome.step == StepResult::RETRY && !sleep_backoff(outcome.backoff)) {
            return;
        }
    }
}

bool Verifier::sleep_backoff(std::chrono::milliseconds duration) {
    backoffs_++;
    std::cout << "[Verifier] Backing off for " << duration.count() << "ms" << std::endl;
    std::unique_lock<std::mutex> lock(mutex_);
    return !wake_cv_.wait_for(lock, duration, [this] { return stopping_; });
}

Verifier::JobOutcome Verifier::process(const VerificationJob& job) {
    std::cout << "[Verifier] Verifying " << job.address << " ("
              << language_to_string(job.toolchain.language) << " "
              << job.toolchain.compiler_version << ")" << std::endl;

    ScopedWorkspace workspace(config_.src_dir, config_.output_dir);

    AcquireResult acquired;
    try {
        acquired = acquirer_.acquire(job, workspace.src_dir());
    } catch (const ConfigError& e) {
        std::cerr << "[Verifier] " << job.address << ": " << e.what() << std::endl;
        finish(job, JobStatus::FAILED);
        return {};
    }

    if (acquired.outcome == AcquireOutcome::FAILED) {
        std::cerr << "[Verifier] " << job.address << ": " << acquired.reason << std::endl;
        finish(job, JobStatus::FAILED);
        return {};
    }
    if (acquired.outcome == AcquireOutcome::RETRY) {
        int attempts = ++attempts_[job.address];
        std::cerr << "[Verifier] " << job.address << ": " << acquired.reason
                  << " (attempt " << attempts << ")" << std::endl;
        if (config_.retry.max_attempts > 0 && attempts >= config_.retry.max_attempts) {
            std::cerr << "[Verifier] " << job.address << ": giving up after "
                      << attempts << " attempts" << std::endl;
            finish(job, JobStatus::FAILED);
            return {};
        }
        JobOutcome outcome;
        outcome.step = StepResult::RETRY;
        outcome.backoff = acquired.backoff == BackoffKind::CLONE ? config_.retry.clone_backoff
                                                                 : config_.retry.network_backoff;
        return outcome;
    }
    attempts_.erase(job.address);

    if (!store_.set_status(job.address, JobStatus::IN_PROGRESS)) {
        std::cerr << "[Verifier] " << job.address << " disappeared from the store" << std::endl;
        return {};
    }

    SandboxResult built;
    try {
        built = sandbox_.run(job.toolchain);
    } catch (const ConfigError& e) {
        std::cerr << "[Verifier] " << job.address << ": " << e.what() << std::endl;
        finish(job, JobStatus::FAILED);
        return {};
    }
    if (!built.succeeded()) {
        std::cerr << "[Verifier] " << job.address << ": build "
                  << sandbox_outcome_to_string(built.outcome);
        if (built.outcome == SandboxOutcome::COMPLETED) {
            std::cerr << " with exit code " << built.exit_code;
        }
        std::cerr << std::endl;
        finish(job, JobStatus::FAILED);
        return {};
    }

    PostProcessResult processed = post_processor_.run(job.toolchain.strip_tool, workspace.output_dir());
    if (!processed.ok) {
        std::cerr << "[Verifier] " << job.address << ": " << processed.error << std::endl;
        finish(job, JobStatus::FAILED);
        return {};
    }

    std::vector<uint8_t> artifact;
    try {
        artifact = FileUtils::read_file(processed.artifact_path);
    } catch (const std::runtime_error& e) {
        std::cerr << "[Verifier] " << job.address << ": " << e.what() << std::endl;
        finish(job, JobStatus::FAILED);
        return {};
    }

    ContentEncoding encoding = config_.default_encoding;
    try {
        encoding = encoding_of(job.expected_content_id);
    } catch (const ContentIdError& e) {
        std::cerr << "[Verifier] " << job.address << ": " << e.what()
                  << ", hashing as " << encoding_to_string(encoding) << std::endl;
    }

    std::string content_id = compute_content_id(artifact, encoding);
    bool matched = content_id == job.expected_content_id;
    std::cout << "[Verifier] " << job.address << " bytecode match: " << (matched ? "TRUE" : "FALSE")
              << " (" << content_id << ")" << std::endl;

    if (!matched) {
        finish(job, JobStatus::NOT_MATCH);
        return {};
    }

    finish_success(job, content_id, artifact, acquired);
    return {};
}

void Verifier::finish(const VerificationJob& job, JobStatus status) {
    if (!store_.set_status(job.address, status)) {
        std::cerr << "[Verifier] " << job.address << " disappeared from the store" << std::endl;
    }
    attempts_.erase(job.address);
    jobs_processed_++;
    std::cout << "[Verifier] " << job.address << " -> " << status_to_string(status) << std::endl;
}

void Verifier::finish_success(const VerificationJob& job, const std::string& content_id,
                              const std::vector<uint8_t>& artifact, const AcquireResult& acquired) {
    SuccessRecord record;
    record.verified_at = std::chrono::system_clock::now();
    record.git_commit = acquired.commit;
    record.license = acquired.license;

    try {
        record.exports = list_exports(artifact);
    } catch (const WasmParseError& e) {
        if (config_.require_exports) {
            std::cerr << "[Verifier] " << job.address << ": " << e.what() << std::endl;
            finish(job, JobStatus::FAILED);
            return;
        }
        std::cout << "[Verifier] " << job.address << ": no export list (" << e.what() << ")" << std::endl;
    }

    if (identity_) {
        Attestation attestation;
        attestation.address = job.address;
        attestation.content_id = content_id;
        attestation.git_commit = record.git_commit;
        attestation.verified_at_ms = to_millis(record.verified_at);

        std::string signature = identity_->sign_attestation(attestation);
        if (signature.empty()) {
            std::cerr << "[Verifier] " << job.address << ": signing failed, recording unsigned" << std::endl;
        } else {
            record.verifier_identity = identity_->get_worker_id();
            record.signature = signature;
        }
    }

    if (!store_.record_success(job.address, record)) {
        std::cerr << "[Verifier] " << job.address << " disappeared from the store" << std::endl;
    }
    attempts_.erase(job.address);
    jobs_processed_++;
    std::cout << "[Verifier] " << job.address << " -> success" << std::endl;
}

AdmissionDecision Verifier::submit(VerificationJob job) {
    AdmissionDecision decision = validate_submission(job, config_);
    if (!decision.accepted()) {
        return decision;
    }

    TimePoint now = std::chrono::system_clock::now();
    decision = evaluate_admission(store_.get_job(job.address), job.expected_content_id,
                                  now, config_.submission_cooldown);
    if (!decision.accepted()) {
        return decision;
    }

    if (auto descriptor = config_.find_toolchain(job.toolchain.language, job.toolchain.compiler_version)) {
        // Versions pinned by the descriptor fill in what the request left out
        for (const auto& [name, version] : descriptor->dependencies) {
            job.toolchain.dependencies.emplace(name, version);
        }
    }

    job.status = job.source_kind == SourceKind::UPLOAD ? JobStatus::PENDING : JobStatus::QUEUED;
    job.requested_at = now;
    job.verified_at.reset();
    job.exports.reset();
    job.git_commit.reset();
    job.verifier_identity.reset();
    job.signature.reset();

    // Files from an earlier attempt never leak into the new one
    store_.delete_source_files(job.address);
    store_.put_job(job);
    std::cout << "[Verifier] Accepted " << job.address << " as " << status_to_string(job.status) << std::endl;

    if (job.status == JobStatus::QUEUED) {
        notify();
    }
    return decision;
}

UploadCheck Verifier::add_source_file(const SourceFile& file) {
    UploadCheck check = check_source_file(store_.get_job(file.address), file);
    if (check == UploadCheck::OK) {
        store_.put_source_file(file);
    }
    return check;
}

CompleteCheck Verifier::complete_upload(const std::string& address) {
    CompleteCheck check = check_complete_upload(store_.get_job(address), store_.count_source_files(address));
    if (check != CompleteCheck::OK) {
        return check;
    }
    if (!store_.set_status(address, JobStatus::QUEUED)) {
        return CompleteCheck::NO_JOB;
    }
    notify();
    return check;
}

} // namespace cverify
