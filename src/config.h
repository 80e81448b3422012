#pragma once

#include "constants.h"
#include "content_id.h"
#include "job.h"
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <stdexcept>

namespace Json {
class Value;
}

namespace cverify {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

// How transient acquisition failures are retried
struct RetryPolicy {
    std::chrono::milliseconds network_backoff{NETWORK_BACKOFF_SECONDS * 1000};
    std::chrono::milliseconds clone_backoff{CLONE_BACKOFF_SECONDS * 1000};
    int max_attempts = 0;  // 0 = retry until the job succeeds or fails for good
};

// Container contract for one language
struct ToolchainProfile {
    std::string image;                  // "{version}" is replaced by the compiler version
    std::string source_mount;           // where the working directory appears in the container
    std::string output_mount = "/out";
    std::string source_subdir;          // uploaded sources are written here
    std::vector<std::string> command;   // runs after `timeout <seconds>`
    std::vector<std::string> required_dependencies;  // must appear in a job's dependency map
    bool package_manifest = false;      // uploads get a root package.json built from the dependencies
};

// Versions a compiler release depends on (runtime, LLVM, SDK packages)
struct ToolchainDescriptor {
    std::string version;
    std::map<std::string, std::string> dependencies;
};

struct VerifierConfig {
    VerifierConfig();

    // Working directories as seen by this process, and as seen by the
    // container daemon when this process itself runs in a container
    std::string src_dir;
    std::string src_host_dir;
    std::string output_dir;
    std::string output_host_dir;

    // Container
    std::string docker_socket = "/var/run/docker.sock";
    std::string container_name = DEFAULT_CONTAINER_NAME;
    bool pull_images = true;  // Pull the toolchain image before each build
    int build_timeout_seconds = DEFAULT_BUILD_TIMEOUT_SECONDS;
    size_t memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    bool fix_permissions = false;
    int sandbox_uid = DEFAULT_SANDBOX_UID;
    int sandbox_gid = DEFAULT_SANDBOX_GID;

    // Repository host
    std::string github_api_url = "https://api.github.com";
    std::string github_clone_url = "https://github.com";
    std::string github_api_key;
    std::string user_agent = "cverify contract verifier";
    std::string git_binary = "git";
    size_t max_repo_size_kb = MAX_REPO_SIZE_KB;

    // Strip tools
    std::string wasm_strip = "wasm-strip";
    std::string wasm_tools = "wasm-tools";

    // Pipeline policy
    RetryPolicy retry;
    std::chrono::seconds submission_cooldown{SUBMISSION_COOLDOWN_SECONDS};
    bool require_exports = false;
    ContentEncoding default_encoding = ContentEncoding::RAW;

    std::map<Language, ToolchainProfile> profiles;
    // language -> compiler version -> descriptor; no entries = any version
    std::map<Language, std::map<std::string, ToolchainDescriptor>> toolchains;

    // Daemon
    std::string store_dir;
    std::string verifier_key_file;
    int poll_interval_seconds = DEFAULT_POLL_INTERVAL_SECONDS;

    const ToolchainProfile& profile(Language language) const;  // throws ConfigError
    bool supports(Language language, const std::string& version) const;
    std::optional<ToolchainDescriptor> find_toolchain(Language language, const std::string& version) const;

    // Host-side bind sources, falling back to the local paths
    std::string effective_src_host_dir() const;
    std::string effective_output_host_dir() const;

    // Missing keys keep their defaults; wrong types throw ConfigError
    static VerifierConfig from_json(const Json::Value& root);
    static VerifierConfig from_file(const std::string& path);
};

ToolchainProfile default_go_profile();
ToolchainProfile default_assemblyscript_profile();

} // namespace cverify
