#include <gtest/gtest.h>
#include "job.h"
#include <json/json.h>

namespace cverify {
namespace {

// ============================================================================
// Enum mappings
// ============================================================================

TEST(JobTest, StatusStringsMatchStoredValues) {
    EXPECT_EQ(status_to_string(JobStatus::PENDING), "pending");
    EXPECT_EQ(status_to_string(JobStatus::QUEUED), "queued");
    EXPECT_EQ(status_to_string(JobStatus::IN_PROGRESS), "in progress");
    EXPECT_EQ(status_to_string(JobStatus::SUCCESS), "success");
    EXPECT_EQ(status_to_string(JobStatus::FAILED), "failed");
    EXPECT_EQ(status_to_string(JobStatus::NOT_MATCH), "not match");

    for (auto status : {JobStatus::PENDING, JobStatus::QUEUED, JobStatus::IN_PROGRESS,
                        JobStatus::SUCCESS, JobStatus::FAILED, JobStatus::NOT_MATCH}) {
        EXPECT_EQ(status_from_string(status_to_string(status)), status);
    }
}

TEST(JobTest, UnknownStatusThrows) {
    EXPECT_THROW(status_from_string("done"), std::invalid_argument);
    EXPECT_THROW(status_from_string(""), std::invalid_argument);
    EXPECT_THROW(status_from_string("in_progress"), std::invalid_argument);
}

TEST(JobTest, LanguageAndStripToolNames) {
    EXPECT_EQ(language_from_string("go"), Language::GOLANG);
    EXPECT_EQ(language_from_string("golang"), Language::GOLANG);
    EXPECT_EQ(language_to_string(Language::ASSEMBLYSCRIPT), "assemblyscript");
    EXPECT_THROW(language_from_string("rust"), std::invalid_argument);

    EXPECT_EQ(strip_tool_from_string(""), StripTool::NONE);
    EXPECT_EQ(strip_tool_from_string("wabt"), StripTool::WABT);
    EXPECT_EQ(strip_tool_from_string("wasm-tools"), StripTool::WASM_TOOLS);
    EXPECT_THROW(strip_tool_from_string("binaryen"), std::invalid_argument);
}

// ============================================================================
// Documents
// ============================================================================

TEST(JobTest, RepositoryJobDocumentRoundTrip) {
    // Given: a verified repository job
    VerificationJob job;
    job.address = "vsc1Contract";
    job.expected_content_id = "bafkreihdwdcefgh4dqkjv67uzcmw7ojee6xedzdetojuzjevtenxquvyku";
    job.source_kind = SourceKind::REPOSITORY;
    job.repo_name = "vsc-eco/contract";
    job.repo_branch = "release";
    job.pinned_commit = "abc123";
    job.toolchain.language = Language::GOLANG;
    job.toolchain.compiler_version = "0.37.0";
    job.toolchain.dependencies = {{"go", "1.24.1"}, {"llvm", "19.1.2"}};
    job.toolchain.strip_tool = StripTool::WASM_TOOLS;
    job.status = JobStatus::SUCCESS;
    job.requested_at = from_millis(1760000000123);
    job.verified_at = from_millis(1760000005000);
    job.license = std::string("MIT");
    job.exports = std::vector<std::string>{"entrypoint"};
    job.git_commit = std::string("abc123");

    // When
    Json::Value doc = job_to_json(job);
    VerificationJob back = job_from_json(doc);

    // Then: stored field names and values
    EXPECT_EQ(doc["_id"].asString(), "vsc1Contract");
    EXPECT_EQ(doc["status"].asString(), "success");
    EXPECT_EQ(doc["request_ts"].asInt64(), 1760000000123);
    EXPECT_TRUE(doc["username"].isNull());

    EXPECT_EQ(back.address, job.address);
    EXPECT_EQ(back.source_kind, SourceKind::REPOSITORY);
    EXPECT_EQ(back.repo_name, "vsc-eco/contract");
    EXPECT_EQ(back.pinned_commit, "abc123");
    EXPECT_EQ(back.toolchain.dependencies, job.toolchain.dependencies);
    EXPECT_EQ(back.toolchain.strip_tool, StripTool::WASM_TOOLS);
    EXPECT_EQ(back.requested_at, job.requested_at);
    ASSERT_TRUE(back.verified_at.has_value());
    EXPECT_EQ(to_millis(*back.verified_at), 1760000005000);
    EXPECT_EQ(back.exports, job.exports);
    EXPECT_EQ(back.license, job.license);
    EXPECT_FALSE(back.signature.has_value());
}

TEST(JobTest, UploadJobHasNoRepositoryFields) {
    VerificationJob job;
    job.address = "vsc1Upload";
    job.expected_content_id = "bafk";
    job.toolchain.language = Language::ASSEMBLYSCRIPT;
    job.requested_at = from_millis(1);

    Json::Value doc = job_to_json(job);

    EXPECT_EQ(doc["source"].asString(), "upload");
    EXPECT_FALSE(doc.isMember("repo_name"));
    EXPECT_TRUE(doc["strip_tool"].isNull());
    EXPECT_EQ(job_from_json(doc).toolchain.strip_tool, StripTool::NONE);
}

TEST(JobTest, MalformedDocumentsThrow) {
    EXPECT_THROW(job_from_json(Json::Value("job")), std::invalid_argument);

    Json::Value missing_status;
    missing_status["_id"] = "a";
    missing_status["bytecode_cid"] = "b";
    missing_status["request_ts"] = 1;
    missing_status["lang"] = "go";
    EXPECT_THROW(job_from_json(missing_status), std::invalid_argument);

    Json::Value bad_status = missing_status;
    bad_status["status"] = "unknown";
    EXPECT_THROW(job_from_json(bad_status), std::invalid_argument);

    Json::Value bad_ts = missing_status;
    bad_ts["status"] = "queued";
    bad_ts["request_ts"] = "yesterday";
    EXPECT_THROW(job_from_json(bad_ts), std::invalid_argument);
}

TEST(JobTest, SourceFileDocument) {
    SourceFile file{"vsc1Upload", "pnpm-lock.yaml", "lockfileVersion: '9.0'\n", true};

    Json::Value doc = source_file_to_json(file);
    SourceFile back = source_file_from_json(doc);

    EXPECT_EQ(doc["addr"].asString(), "vsc1Upload");
    EXPECT_EQ(doc["fname"].asString(), "pnpm-lock.yaml");
    EXPECT_EQ(back.content, file.content);
    EXPECT_TRUE(back.is_lockfile);
}

} // namespace
} // namespace cverify
