#include "config.h"
#include <json/json.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace cverify {

namespace {

void read_string(const Json::Value& obj, const char* key, std::string& target) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isString()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    target = obj[key].asString();
}

void read_int(const Json::Value& obj, const char* key, int& target, int min_value) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isInt()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    int value = obj[key].asInt();
    if (value < min_value) {
        throw ConfigError(std::string("'") + key + "' must be at least " + std::to_string(min_value));
    }
    target = value;
}

void read_size(const Json::Value& obj, const char* key, size_t& target) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isUInt64()) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    target = static_cast<size_t>(obj[key].asUInt64());
}

void read_bool(const Json::Value& obj, const char* key, bool& target) {
    if (!obj.isMember(key)) return;
    if (!obj[key].isBool()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    target = obj[key].asBool();
}

const Json::Value& read_object(const Json::Value& obj, const char* key) {
    static const Json::Value empty(Json::objectValue);
    if (!obj.isMember(key)) return empty;
    if (!obj[key].isObject()) {
        throw ConfigError(std::string("'") + key + "' must be an object");
    }
    return obj[key];
}

Language parse_language(const std::string& name) {
    try {
        return language_from_string(name);
    } catch (const std::invalid_argument&) {
        throw ConfigError("unknown language '" + name + "'");
    }
}

void read_profile(const Json::Value& obj, ToolchainProfile& profile) {
    read_string(obj, "image", profile.image);
    read_string(obj, "source_mount", profile.source_mount);
    read_string(obj, "output_mount", profile.output_mount);
    read_string(obj, "source_subdir", profile.source_subdir);
    read_bool(obj, "package_manifest", profile.package_manifest);

    if (obj.isMember("command")) {
        const Json::Value& command = obj["command"];
        if (!command.isArray() || command.empty()) {
            throw ConfigError("'command' must be a non-empty array of strings");
        }
        profile.command.clear();
        for (const auto& arg : command) {
            if (!arg.isString()) {
                throw ConfigError("'command' must be a non-empty array of strings");
            }
            profile.command.push_back(arg.asString());
        }
    }

    if (obj.isMember("required_dependencies")) {
        const Json::Value& deps = obj["required_dependencies"];
        if (!deps.isArray()) {
            throw ConfigError("'required_dependencies' must be an array of strings");
        }
        profile.required_dependencies.clear();
        for (const auto& dep : deps) {
            if (!dep.isString()) {
                throw ConfigError("'required_dependencies' must be an array of strings");
            }
            profile.required_dependencies.push_back(dep.asString());
        }
    }

    if (profile.image.empty() || profile.source_mount.empty() || profile.command.empty()) {
        throw ConfigError("toolchain profile needs image, source_mount and command");
    }
}

} // namespace

ToolchainProfile default_go_profile() {
    ToolchainProfile profile;
    profile.image = "tinygo/tinygo:{version}";
    profile.source_mount = "/home/tinygo";
    profile.source_subdir = "contract";
    profile.command = {
        "tinygo", "build",
        "-gc=custom", "-scheduler=none", "-panic=trap", "-no-debug",
        "-target=wasm-unknown",
        "-o=/out/build.wasm",
        "./contract"
    };
    return profile;
}

ToolchainProfile default_assemblyscript_profile() {
    ToolchainProfile profile;
    profile.image = "node:{version}";
    profile.source_mount = "/workdir";
    profile.source_subdir = "assembly";
    profile.package_manifest = true;
    profile.command = {
        "sh", "-c",
        "corepack enable && pnpm install --frozen-lockfile && "
        "pnpm exec asc assembly/index.ts --optimize --outFile /out/build.wasm"
    };
    return profile;
}

VerifierConfig::VerifierConfig() {
    fs::path base = fs::current_path() / "cverify";
    src_dir = (base / "src").string();
    output_dir = (base / "out").string();
    store_dir = (base / "store").string();

    profiles[Language::GOLANG] = default_go_profile();
    profiles[Language::ASSEMBLYSCRIPT] = default_assemblyscript_profile();
}

const ToolchainProfile& VerifierConfig::profile(Language language) const {
    auto it = profiles.find(language);
    if (it == profiles.end()) {
        throw ConfigError("no toolchain profile for " + language_to_string(language));
    }
    return it->second;
}

bool VerifierConfig::supports(Language language, const std::string& version) const {
    if (version.empty() || profiles.count(language) == 0) {
        return false;
    }
    auto it = toolchains.find(language);
    if (it == toolchains.end() || it->second.empty()) {
        return true;
    }
    return it->second.count(version) > 0;
}

std::optional<ToolchainDescriptor> VerifierConfig::find_toolchain(Language language,
                                                                  const std::string& version) const {
    auto it = toolchains.find(language);
    if (it == toolchains.end()) {
        return std::nullopt;
    }
    auto entry = it->second.find(version);
    if (entry == it->second.end()) {
        return std::nullopt;
    }
    return entry->second;
}

std::string VerifierConfig::effective_src_host_dir() const {
    return src_host_dir.empty() ? src_dir : src_host_dir;
}

std::string VerifierConfig::effective_output_host_dir() const {
    return output_host_dir.empty() ? output_dir : output_host_dir;
}

VerifierConfig VerifierConfig::from_json(const Json::Value& root) {
    if (!root.isObject()) {
        throw ConfigError("top level must be an object");
    }

    VerifierConfig config;

    read_string(root, "src_dir", config.src_dir);
    read_string(root, "src_host_dir", config.src_host_dir);
    read_string(root, "output_dir", config.output_dir);
    read_string(root, "output_host_dir", config.output_host_dir);
    read_string(root, "store_dir", config.store_dir);

    read_string(root, "docker_socket", config.docker_socket);
    read_string(root, "container_name", config.container_name);
    read_bool(root, "pull_images", config.pull_images);
    read_int(root, "timeout", config.build_timeout_seconds, 1);
    read_size(root, "memory_limit_bytes", config.memory_limit_bytes);
    read_bool(root, "fix_permissions", config.fix_permissions);
    read_int(root, "sandbox_uid", config.sandbox_uid, 0);
    read_int(root, "sandbox_gid", config.sandbox_gid, 0);

    read_string(root, "github_api_key", config.github_api_key);
    read_string(root, "github_api_url", config.github_api_url);
    read_string(root, "github_clone_url", config.github_clone_url);
    read_string(root, "user_agent", config.user_agent);
    read_string(root, "git", config.git_binary);
    read_size(root, "max_repo_size_kb", config.max_repo_size_kb);

    read_string(root, "wasm_strip", config.wasm_strip);
    read_string(root, "wasm_tools", config.wasm_tools);

    const Json::Value& retry = read_object(root, "retry");
    int network_backoff = NETWORK_BACKOFF_SECONDS;
    int clone_backoff = CLONE_BACKOFF_SECONDS;
    read_int(retry, "network_backoff_seconds", network_backoff, 0);
    read_int(retry, "clone_backoff_seconds", clone_backoff, 0);
    read_int(retry, "max_attempts", config.retry.max_attempts, 0);
    config.retry.network_backoff = std::chrono::seconds(network_backoff);
    config.retry.clone_backoff = std::chrono::seconds(clone_backoff);

    int cooldown = SUBMISSION_COOLDOWN_SECONDS;
    read_int(root, "submission_cooldown_seconds", cooldown, 0);
    config.submission_cooldown = std::chrono::seconds(cooldown);
    read_bool(root, "require_exports", config.require_exports);

    if (root.isMember("default_encoding")) {
        std::string name;
        read_string(root, "default_encoding", name);
        try {
            config.default_encoding = encoding_from_string(name);
        } catch (const std::invalid_argument&) {
            throw ConfigError("unknown encoding '" + name + "'");
        }
    }

    const Json::Value& profiles = read_object(root, "profiles");
    for (const auto& name : profiles.getMemberNames()) {
        Language language = parse_language(name);
        if (!profiles[name].isObject()) {
            throw ConfigError("profile '" + name + "' must be an object");
        }
        // Partial overrides start from the built-in profile
        read_profile(profiles[name], config.profiles[language]);
    }

    const Json::Value& toolchains = read_object(root, "toolchains");
    for (const auto& name : toolchains.getMemberNames()) {
        Language language = parse_language(name);
        const Json::Value& versions = read_object(toolchains, name.c_str());
        auto& table = config.toolchains[language];
        for (const auto& version : versions.getMemberNames()) {
            const Json::Value& deps = read_object(versions, version.c_str());
            ToolchainDescriptor descriptor;
            descriptor.version = version;
            for (const auto& dep : deps.getMemberNames()) {
                read_string(deps, dep.c_str(), descriptor.dependencies[dep]);
            }
            table[version] = descriptor;
        }
    }

    read_string(root, "verifier_key_file", config.verifier_key_file);
    read_int(root, "poll_interval_seconds", config.poll_interval_seconds, 1);

    if (config.src_dir.empty() || config.output_dir.empty()) {
        throw ConfigError("src_dir and output_dir must not be empty");
    }
    if (config.src_dir == config.output_dir) {
        throw ConfigError("src_dir and output_dir must differ");
    }

    return config;
}

VerifierConfig VerifierConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw ConfigError("cannot parse " + path + ": " + errors);
    }
    return from_json(root);
}

} // namespace cverify
