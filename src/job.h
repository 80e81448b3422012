#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <cstdint>

namespace Json {
class Value;
}

namespace cverify {

using TimePoint = std::chrono::system_clock::time_point;

enum class JobStatus {
    PENDING,      // Waiting for source uploads
    QUEUED,       // Ready for the worker
    IN_PROGRESS,  // Source acquired, build running
    SUCCESS,
    FAILED,
    NOT_MATCH     // Build worked, bytecode differs
};

// Exhaustive mapping to the strings stored in the job collection
std::string status_to_string(JobStatus status);
JobStatus status_from_string(const std::string& value);  // throws std::invalid_argument

enum class Language {
    GOLANG,
    ASSEMBLYSCRIPT
};

std::string language_to_string(Language language);
Language language_from_string(const std::string& value);

enum class StripTool {
    NONE,
    WABT,       // wasm-strip
    WASM_TOOLS  // wasm-tools strip
};

std::string strip_tool_to_string(StripTool tool);
StripTool strip_tool_from_string(const std::string& value);

enum class SourceKind {
    UPLOAD,      // SourceFile rows for the address
    REPOSITORY   // Pinned commit of a hosted repository
};

struct Toolchain {
    Language language = Language::GOLANG;
    std::string compiler_version;                     // e.g. tinygo "0.37.0"
    std::map<std::string, std::string> dependencies;  // resolved runtime/library versions
    StripTool strip_tool = StripTool::NONE;
};

struct VerificationJob {
    std::string address;
    std::string expected_content_id;                  // CID recorded on chain

    SourceKind source_kind = SourceKind::UPLOAD;
    std::string repo_name;                            // owner/name
    std::string repo_branch;                          // empty = repository default
    std::string pinned_commit;                        // empty = branch head

    Toolchain toolchain;
    JobStatus status = JobStatus::PENDING;
    TimePoint requested_at;

    std::optional<std::string> username;
    std::optional<std::string> license;
    std::optional<TimePoint> verified_at;
    std::optional<std::vector<std::string>> exports;
    std::optional<std::string> git_commit;
    std::optional<std::string> verifier_identity;
    std::optional<std::string> signature;
};

struct SourceFile {
    std::string address;
    std::string filename;
    std::string content;
    bool is_lockfile = false;
};

// Fields written together when a job reaches SUCCESS
struct SuccessRecord {
    TimePoint verified_at;
    std::optional<std::string> git_commit;
    std::optional<std::string> license;
    std::optional<std::vector<std::string>> exports;
    std::optional<std::string> verifier_identity;
    std::optional<std::string> signature;
};

// Persistence boundary. Timestamps are milliseconds since the epoch.
Json::Value job_to_json(const VerificationJob& job);
VerificationJob job_from_json(const Json::Value& json);  // throws std::invalid_argument
Json::Value source_file_to_json(const SourceFile& file);
SourceFile source_file_from_json(const Json::Value& json);

int64_t to_millis(TimePoint tp);
TimePoint from_millis(int64_t ms);

} // namespace cverify
