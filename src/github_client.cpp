#include "github_client.h"
#include "config.h"
#include <json/json.h>
#include <iostream>
#include <memory>

namespace cverify {

namespace {

bool parse_body(const std::string& body, Json::Value& root, std::string& errors) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(body.data(), body.data() + body.size(), &root, &errors);
}

} // namespace

GithubClient::GithubClient(const VerifierConfig& config)
    : api_url_(config.github_api_url),
      clone_base_(config.github_clone_url),
      api_key_(config.github_api_key),
      user_agent_(config.user_agent),
      http_() {}

std::vector<std::string> GithubClient::headers() const {
    std::vector<std::string> headers = {
        "Accept: application/vnd.github+json",
        "User-Agent: " + user_agent_,
        "X-GitHub-Api-Version: 2022-11-28"
    };
    if (!api_key_.empty()) {
        headers.push_back("Authorization: Bearer " + api_key_);
    }
    return headers;
}

FetchStatus GithubClient::classify(long status_code) {
    if (status_code >= 200 && status_code < 300) return FetchStatus::OK;
    if (status_code == 404) return FetchStatus::NOT_FOUND;
    return FetchStatus::UNAVAILABLE;
}

FetchResult<RepoInfo> GithubClient::parse_repository(long status_code, const std::string& body) {
    FetchResult<RepoInfo> result;
    result.status = classify(status_code);
    if (result.status != FetchStatus::OK) {
        result.detail = "HTTP " + std::to_string(status_code);
        return result;
    }

    Json::Value root;
    std::string errors;
    if (!parse_body(body, root, errors) || !root.isObject()) {
        result.status = FetchStatus::MALFORMED;
        result.detail = "repository body is not a JSON object " + errors;
        return result;
    }
    if (!root["default_branch"].isString() || !root["size"].isUInt64()) {
        result.status = FetchStatus::MALFORMED;
        result.detail = "repository body lacks default_branch or size";
        return result;
    }

    result.value.default_branch = root["default_branch"].asString();
    result.value.size_kb = static_cast<size_t>(root["size"].asUInt64());
    const Json::Value& license = root["license"];
    if (license.isObject() && license["spdx_id"].isString()) {
        result.value.license = license["spdx_id"].asString();
    }
    return result;
}

FetchResult<BranchInfo> GithubClient::parse_branch(long status_code, const std::string& body) {
    FetchResult<BranchInfo> result;
    result.status = classify(status_code);
    if (result.status != FetchStatus::OK) {
        result.detail = "HTTP " + std::to_string(status_code);
        return result;
    }

    Json::Value root;
    std::string errors;
    if (!parse_body(body, root, errors) || !root.isObject()) {
        result.status = FetchStatus::MALFORMED;
        result.detail = "branch body is not a JSON object " + errors;
        return result;
    }
    const Json::Value& commit = root["commit"];
    if (!commit.isObject() || !commit["sha"].isString() || commit["sha"].asString().empty()) {
        result.status = FetchStatus::MALFORMED;
        result.detail = "branch body lacks commit.sha";
        return result;
    }

    result.value.commit_sha = commit["sha"].asString();
    return result;
}

FetchResult<RepoInfo> GithubClient::repository(const std::string& repo) {
    HttpResponse response = http_.get(api_url_ + "/repos/" + repo, headers());
    if (!response.transport_ok()) {
        std::cerr << "[GitHub] GET /repos/" << repo << " failed: " << response.error << std::endl;
        FetchResult<RepoInfo> result;
        result.detail = response.error;
        return result;
    }

    auto result = parse_repository(response.status_code, response.body);
    if (!result.ok()) {
        std::cerr << "[GitHub] /repos/" << repo << ": " << result.detail << std::endl;
    }
    return result;
}

FetchResult<BranchInfo> GithubClient::branch(const std::string& repo, const std::string& branch) {
    std::string path = "/repos/" + repo + "/branches/" + url_escape(branch);
    HttpResponse response = http_.get(api_url_ + path, headers());
    if (!response.transport_ok()) {
        std::cerr << "[GitHub] GET " << path << " failed: " << response.error << std::endl;
        FetchResult<BranchInfo> result;
        result.detail = response.error;
        return result;
    }

    auto result = parse_branch(response.status_code, response.body);
    if (!result.ok()) {
        std::cerr << "[GitHub] " << path << ": " << result.detail << std::endl;
    }
    return result;
}

std::string GithubClient::clone_url(const std::string& repo) const {
    return clone_base_ + "/" + repo;
}

} // namespace cverify
