#include <gtest/gtest.h>
#include "job_store.h"
#include "json_job_store.h"
#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace cverify {
namespace {

VerificationJob make_job(const std::string& address, JobStatus status, int64_t requested_ms) {
    VerificationJob job;
    job.address = address;
    job.expected_content_id = "bafkreihdwdcefgh4dqkjv67uzcmw7ojee6xedzdetojuzjevtenxquvyku";
    job.toolchain.language = Language::GOLANG;
    job.toolchain.compiler_version = "0.37.0";
    job.status = status;
    job.requested_at = from_millis(requested_ms);
    return job;
}

// ============================================================================
// Shared contract, run against both stores
// ============================================================================

enum class StoreKind { MEMORY, JSON_FILE };

class JobStoreContractTest : public ::testing::TestWithParam<StoreKind> {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "cverify_job_store_contract";
        std::filesystem::remove_all(test_dir);
        if (GetParam() == StoreKind::MEMORY) {
            store = std::make_unique<InMemoryJobStore>();
        } else {
            store = std::make_unique<JsonFileJobStore>(test_dir.string());
        }
    }

    void TearDown() override {
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
    std::unique_ptr<JobStore> store;
};

TEST_P(JobStoreContractTest, NextQueuedIsOldestQueued) {
    // Given: queued jobs out of insertion order, plus non-queued noise
    store->put_job(make_job("c", JobStatus::QUEUED, 300));
    store->put_job(make_job("a", JobStatus::QUEUED, 200));
    store->put_job(make_job("old-pending", JobStatus::PENDING, 1));
    store->put_job(make_job("old-failed", JobStatus::FAILED, 2));

    // Then: oldest queued first
    auto next = store->next_queued();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->address, "a");

    store->set_status("a", JobStatus::SUCCESS);
    next = store->next_queued();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->address, "c");

    store->set_status("c", JobStatus::IN_PROGRESS);
    EXPECT_FALSE(store->next_queued().has_value());
}

TEST_P(JobStoreContractTest, TimestampTieBrokenByAddress) {
    store->put_job(make_job("zeta", JobStatus::QUEUED, 100));
    store->put_job(make_job("alpha", JobStatus::QUEUED, 100));

    auto next = store->next_queued();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->address, "alpha");
}

TEST_P(JobStoreContractTest, PutJobReplacesByAddress) {
    store->put_job(make_job("a", JobStatus::FAILED, 1));
    store->put_job(make_job("a", JobStatus::QUEUED, 2));

    auto job = store->get_job("a");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::QUEUED);
    EXPECT_EQ(to_millis(job->requested_at), 2);
}

TEST_P(JobStoreContractTest, UnknownAddress) {
    EXPECT_FALSE(store->get_job("missing").has_value());
    EXPECT_FALSE(store->set_status("missing", JobStatus::FAILED));
    EXPECT_FALSE(store->record_success("missing", SuccessRecord{}));
}

TEST_P(JobStoreContractTest, RecordSuccessWritesMetadataTogether) {
    VerificationJob job = make_job("a", JobStatus::IN_PROGRESS, 1);
    job.license = std::string("Apache-2.0");
    store->put_job(job);

    SuccessRecord record;
    record.verified_at = from_millis(5000);
    record.git_commit = std::string("deadbeef");
    record.exports = std::vector<std::string>{"entrypoint"};
    record.verifier_identity = std::string("key");
    record.signature = std::string("sig");
    ASSERT_TRUE(store->record_success("a", record));

    auto stored = store->get_job("a");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, JobStatus::SUCCESS);
    EXPECT_EQ(to_millis(*stored->verified_at), 5000);
    EXPECT_EQ(stored->git_commit, std::optional<std::string>("deadbeef"));
    // A record without a license keeps the submitted one
    EXPECT_EQ(stored->license, std::optional<std::string>("Apache-2.0"));
    EXPECT_EQ(stored->exports, record.exports);
    EXPECT_EQ(stored->signature, std::optional<std::string>("sig"));
}

TEST_P(JobStoreContractTest, SourceFilesKeyedByAddressAndName) {
    store->put_source_file({"a", "main.go", "v1", false});
    store->put_source_file({"a", "main.go", "v2", false});
    store->put_source_file({"a", "go.mod", "module x", false});
    store->put_source_file({"b", "index.ts", "export", false});

    EXPECT_EQ(store->count_source_files("a"), 2u);
    auto files = store->source_files("a");
    ASSERT_EQ(files.size(), 2u);
    for (const auto& f : files) {
        if (f.filename == "main.go") {
            EXPECT_EQ(f.content, "v2");
        }
    }

    store->delete_source_files("a");
    EXPECT_EQ(store->count_source_files("a"), 0u);
    EXPECT_EQ(store->count_source_files("b"), 1u);
    EXPECT_NO_THROW(store->delete_source_files("missing"));
}

INSTANTIATE_TEST_SUITE_P(Stores, JobStoreContractTest,
                         ::testing::Values(StoreKind::MEMORY, StoreKind::JSON_FILE));

// ============================================================================
// JSON file store specifics
// ============================================================================

class JsonFileJobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "cverify_json_store_test";
        std::filesystem::remove_all(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(JsonFileJobStoreTest, StatePersistsAcrossReopen) {
    // Given: a store with a job and a source file
    {
        JsonFileJobStore store(test_dir.string());
        store.put_job(make_job("a", JobStatus::QUEUED, 10));
        store.put_source_file({"a", "main.go", "package main", false});
        store.set_status("a", JobStatus::NOT_MATCH);
    }

    // When: reopened
    JsonFileJobStore reopened(test_dir.string());

    // Then
    auto job = reopened.get_job("a");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::NOT_MATCH);
    EXPECT_EQ(to_millis(job->requested_at), 10);
    EXPECT_EQ(reopened.count_source_files("a"), 1u);
    EXPECT_FALSE(std::filesystem::exists(test_dir / "jobs.json.tmp"));
}

TEST_F(JsonFileJobStoreTest, CorruptDocumentThrows) {
    std::filesystem::create_directories(test_dir);
    std::ofstream(test_dir / "jobs.json") << "{ not json";

    EXPECT_THROW(JsonFileJobStore store(test_dir.string()), StoreError);
}

TEST_F(JsonFileJobStoreTest, InvalidJobDocumentThrows) {
    std::filesystem::create_directories(test_dir);
    std::ofstream(test_dir / "jobs.json") << R"({"a": {"_id": "a", "status": "bogus"}})";

    EXPECT_THROW(JsonFileJobStore store(test_dir.string()), StoreError);
}

TEST_F(JsonFileJobStoreTest, MistypedFieldThrowsStoreError) {
    // Given: an otherwise valid job whose source kind is an object
    std::filesystem::create_directories(test_dir);
    Json::Value root(Json::objectValue);
    root["a"] = job_to_json(make_job("a", JobStatus::QUEUED, 10));
    root["a"]["source"] = Json::Value(Json::objectValue);
    std::ofstream(test_dir / "jobs.json") << root.toStyledString();

    EXPECT_THROW(JsonFileJobStore store(test_dir.string()), StoreError);
}

// ============================================================================
// Sharing the directory with another writer
// ============================================================================

TEST_F(JsonFileJobStoreTest, SeesJobsWrittenByAnotherProcess) {
    // Given: the daemon's store, opened before any job exists
    JsonFileJobStore daemon(test_dir.string());
    daemon.put_job(make_job("existing", JobStatus::SUCCESS, 5));
    ASSERT_FALSE(daemon.next_queued().has_value());

    // When: another writer queues a job with a file
    {
        JsonFileJobStore api(test_dir.string());
        api.put_job(make_job("vsc1New", JobStatus::QUEUED, 10));
        api.put_source_file({"vsc1New", "main.go", "package main", false});
    }

    // Then: the daemon picks it up
    auto next = daemon.next_queued();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->address, "vsc1New");
    EXPECT_EQ(daemon.count_source_files("vsc1New"), 1u);
}

TEST_F(JsonFileJobStoreTest, WritesKeepJobsAddedByAnotherProcess) {
    JsonFileJobStore daemon(test_dir.string());
    daemon.put_job(make_job("existing", JobStatus::QUEUED, 5));
    {
        JsonFileJobStore api(test_dir.string());
        api.put_job(make_job("vsc1New", JobStatus::QUEUED, 10));
    }

    // A worker write on another job
    ASSERT_TRUE(daemon.set_status("existing", JobStatus::IN_PROGRESS));

    JsonFileJobStore reopened(test_dir.string());
    ASSERT_TRUE(reopened.get_job("vsc1New").has_value());
    EXPECT_EQ(reopened.get_job("existing")->status, JobStatus::IN_PROGRESS);
}

TEST_F(JsonFileJobStoreTest, CorruptionAfterOpenThrowsOnNextCall) {
    JsonFileJobStore store(test_dir.string());
    store.put_job(make_job("a", JobStatus::QUEUED, 10));

    std::ofstream(test_dir / "jobs.json", std::ios::trunc) << "[ truncated";

    EXPECT_THROW(store.next_queued(), StoreError);
}

// ============================================================================
// Failed writes
// ============================================================================

TEST_F(JsonFileJobStoreTest, FailedWriteLeavesJobUnchanged) {
    // Given: a queued job, and a directory squatting on the temp file name
    JsonFileJobStore store(test_dir.string());
    store.put_job(make_job("a", JobStatus::QUEUED, 10));
    std::filesystem::create_directories(test_dir / "jobs.json.tmp");

    // When
    EXPECT_THROW(store.set_status("a", JobStatus::IN_PROGRESS), StoreError);
    EXPECT_THROW(store.put_job(make_job("b", JobStatus::QUEUED, 20)), StoreError);

    // Then: memory agrees with disk
    EXPECT_EQ(store.get_job("a")->status, JobStatus::QUEUED);
    EXPECT_FALSE(store.get_job("b").has_value());
    auto next = store.next_queued();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->address, "a");

    // Writes resume once the path is usable
    std::filesystem::remove_all(test_dir / "jobs.json.tmp");
    EXPECT_TRUE(store.set_status("a", JobStatus::IN_PROGRESS));
    EXPECT_EQ(JsonFileJobStore(test_dir.string()).get_job("a")->status, JobStatus::IN_PROGRESS);
}

TEST_F(JsonFileJobStoreTest, FailedSourceWriteKeepsFiles) {
    JsonFileJobStore store(test_dir.string());
    store.put_source_file({"a", "main.go", "package main", false});
    std::filesystem::create_directories(test_dir / "sources.json.tmp");

    EXPECT_THROW(store.delete_source_files("a"), StoreError);
    EXPECT_THROW(store.put_source_file({"a", "util.go", "package main", false}), StoreError);

    EXPECT_EQ(store.count_source_files("a"), 1u);
}

} // namespace
} // namespace cverify
