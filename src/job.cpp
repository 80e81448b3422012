#include "job.h"
#include <json/json.h>
#include <stdexcept>

namespace cverify {

std::string status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::QUEUED: return "queued";
        case JobStatus::IN_PROGRESS: return "in progress";
        case JobStatus::SUCCESS: return "success";
        case JobStatus::FAILED: return "failed";
        case JobStatus::NOT_MATCH: return "not match";
    }
    throw std::invalid_argument("Unknown job status");
}

JobStatus status_from_string(const std::string& value) {
    if (value == "pending") return JobStatus::PENDING;
    if (value == "queued") return JobStatus::QUEUED;
    if (value == "in progress") return JobStatus::IN_PROGRESS;
    if (value == "success") return JobStatus::SUCCESS;
    if (value == "failed") return JobStatus::FAILED;
    if (value == "not match") return JobStatus::NOT_MATCH;
    throw std::invalid_argument("Unknown job status: " + value);
}

std::string language_to_string(Language language) {
    switch (language) {
        case Language::GOLANG: return "golang";
        case Language::ASSEMBLYSCRIPT: return "assemblyscript";
    }
    throw std::invalid_argument("Unknown language");
}

Language language_from_string(const std::string& value) {
    if (value == "golang" || value == "go") return Language::GOLANG;
    if (value == "assemblyscript") return Language::ASSEMBLYSCRIPT;
    throw std::invalid_argument("Unsupported language: " + value);
}

std::string strip_tool_to_string(StripTool tool) {
    switch (tool) {
        case StripTool::NONE: return "";
        case StripTool::WABT: return "wabt";
        case StripTool::WASM_TOOLS: return "wasm-tools";
    }
    throw std::invalid_argument("Unknown strip tool");
}

StripTool strip_tool_from_string(const std::string& value) {
    if (value.empty()) return StripTool::NONE;
    if (value == "wabt") return StripTool::WABT;
    if (value == "wasm-tools") return StripTool::WASM_TOOLS;
    throw std::invalid_argument("Unknown strip tool: " + value);
}

int64_t to_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_millis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

namespace {

void put_optional(Json::Value& json, const char* key, const std::optional<std::string>& value) {
    if (value) {
        json[key] = *value;
    } else {
        json[key] = Json::Value(Json::nullValue);
    }
}

std::optional<std::string> get_optional(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || json[key].isNull()) {
        return std::nullopt;
    }
    if (!json[key].isString()) {
        throw std::invalid_argument(std::string("Field '") + key + "' must be a string");
    }
    return json[key].asString();
}

std::string get_required(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || !json[key].isString()) {
        throw std::invalid_argument(std::string("Missing string field '") + key + "'");
    }
    return json[key].asString();
}

} // namespace

Json::Value job_to_json(const VerificationJob& job) {
    Json::Value json;
    json["_id"] = job.address;
    json["bytecode_cid"] = job.expected_content_id;
    json["status"] = status_to_string(job.status);
    json["request_ts"] = static_cast<Json::Int64>(to_millis(job.requested_at));

    if (job.source_kind == SourceKind::REPOSITORY) {
        json["source"] = "repository";
        json["repo_name"] = job.repo_name;
        json["repo_branch"] = job.repo_branch;
        json["pinned_commit"] = job.pinned_commit;
    } else {
        json["source"] = "upload";
    }

    json["lang"] = language_to_string(job.toolchain.language);
    json["compiler_version"] = job.toolchain.compiler_version;
    Json::Value deps(Json::objectValue);
    for (const auto& [name, version] : job.toolchain.dependencies) {
        deps[name] = version;
    }
    json["dependencies"] = deps;
    json["strip_tool"] = job.toolchain.strip_tool == StripTool::NONE
        ? Json::Value(Json::nullValue)
        : Json::Value(strip_tool_to_string(job.toolchain.strip_tool));

    put_optional(json, "username", job.username);
    put_optional(json, "license", job.license);
    put_optional(json, "git_commit", job.git_commit);
    put_optional(json, "verifier", job.verifier_identity);
    put_optional(json, "signature", job.signature);

    if (job.verified_at) {
        json["verified_ts"] = static_cast<Json::Int64>(to_millis(*job.verified_at));
    } else {
        json["verified_ts"] = Json::Value(Json::nullValue);
    }

    if (job.exports) {
        Json::Value exports(Json::arrayValue);
        for (const auto& name : *job.exports) {
            exports.append(name);
        }
        json["exports"] = exports;
    } else {
        json["exports"] = Json::Value(Json::nullValue);
    }

    return json;
}

VerificationJob job_from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("Job document must be an object");
    }

    VerificationJob job;
    job.address = get_required(json, "_id");
    job.expected_content_id = get_required(json, "bytecode_cid");
    job.status = status_from_string(get_required(json, "status"));
    if (!json["request_ts"].isIntegral()) {
        throw std::invalid_argument("Missing integer field 'request_ts'");
    }
    job.requested_at = from_millis(json["request_ts"].asInt64());

    std::string source = json.get("source", "upload").asString();
    if (source == "repository") {
        job.source_kind = SourceKind::REPOSITORY;
        job.repo_name = get_required(json, "repo_name");
        job.repo_branch = json.get("repo_branch", "").asString();
        job.pinned_commit = json.get("pinned_commit", "").asString();
    } else if (source == "upload") {
        job.source_kind = SourceKind::UPLOAD;
    } else {
        throw std::invalid_argument("Unknown source kind: " + source);
    }

    job.toolchain.language = language_from_string(get_required(json, "lang"));
    job.toolchain.compiler_version = json.get("compiler_version", "").asString();
    const Json::Value& deps = json["dependencies"];
    if (deps.isObject()) {
        for (const auto& name : deps.getMemberNames()) {
            job.toolchain.dependencies[name] = deps[name].asString();
        }
    }
    job.toolchain.strip_tool = strip_tool_from_string(get_optional(json, "strip_tool").value_or(""));

    job.username = get_optional(json, "username");
    job.license = get_optional(json, "license");
    job.git_commit = get_optional(json, "git_commit");
    job.verifier_identity = get_optional(json, "verifier");
    job.signature = get_optional(json, "signature");

    if (json["verified_ts"].isIntegral()) {
        job.verified_at = from_millis(json["verified_ts"].asInt64());
    }
    if (json["exports"].isArray()) {
        std::vector<std::string> exports;
        for (const auto& e : json["exports"]) {
            exports.push_back(e.asString());
        }
        job.exports = exports;
    }

    return job;
}

Json::Value source_file_to_json(const SourceFile& file) {
    Json::Value json;
    json["addr"] = file.address;
    json["fname"] = file.filename;
    json["content"] = file.content;
    json["is_lockfile"] = file.is_lockfile;
    return json;
}

SourceFile source_file_from_json(const Json::Value& json) {
    SourceFile file;
    file.address = get_required(json, "addr");
    file.filename = get_required(json, "fname");
    file.content = get_required(json, "content");
    file.is_lockfile = json.get("is_lockfile", false).asBool();
    return file;
}

} // namespace cverify
