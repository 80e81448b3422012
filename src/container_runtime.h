#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace cverify {

struct ContainerSpec {
    std::string name;
    std::string image;
    std::vector<std::string> command;
    std::string working_dir;           // Empty = image default
    std::vector<std::string> binds;    // "host_path:container_path"
    uint64_t memory_bytes = 0;         // 0 = unlimited
    bool auto_remove = true;
};

struct RuntimeStatus {
    bool ok = false;
    std::string error;
};

struct CreateResult {
    bool ok = false;
    std::string id;
    std::string error;
};

struct WaitResult {
    bool ok = false;
    int64_t exit_code = -1;
    std::string error;
};

// An exit registration taken before the container starts
class ExitWatch {
public:
    virtual ~ExitWatch() = default;

    // Blocks until the watched container exits
    virtual WaitResult wait() = 0;
};

// The slice of a container engine the build sandbox needs
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Make the image available locally
    virtual RuntimeStatus pull(const std::string& image) = 0;

    virtual CreateResult create(const ContainerSpec& spec) = 0;

    // Must be called before start: an auto-removed container that exits
    // at once is gone before a later wait could find it. Dropping the
    // watch without waiting abandons it.
    virtual std::unique_ptr<ExitWatch> watch(const std::string& id, bool auto_remove) = 0;

    virtual RuntimeStatus start(const std::string& id) = 0;

    // Force removal; a container that does not exist counts as removed
    virtual RuntimeStatus remove(const std::string& name_or_id) = 0;
};

} // namespace cverify
