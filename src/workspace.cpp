#include "workspace.h"
#include "file_utils.h"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cverify {

ScopedWorkspace::ScopedWorkspace(std::string src_dir, std::string output_dir)
    : src_dir_(std::move(src_dir)), output_dir_(std::move(output_dir)) {
    std::error_code ec;

    fs::remove_all(src_dir_, ec);
    if (ec) {
        throw WorkspaceError("cannot delete " + src_dir_ + ": " + ec.message());
    }
    fs::create_directories(src_dir_, ec);
    if (ec) {
        throw WorkspaceError("cannot create " + src_dir_ + ": " + ec.message());
    }

    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw WorkspaceError("cannot create " + output_dir_ + ": " + ec.message());
    }
    if (!FileUtils::clear_directory(output_dir_, ec)) {
        throw WorkspaceError("cannot empty " + output_dir_ + ": " + ec.message());
    }
}

ScopedWorkspace::~ScopedWorkspace() {
    std::error_code ec;
    fs::remove_all(src_dir_, ec);
    if (ec) {
        std::cerr << "[Verifier] Failed to delete " << src_dir_ << ": " << ec.message() << std::endl;
    }

    ec.clear();
    if (!FileUtils::clear_directory(output_dir_, ec)) {
        std::cerr << "[Verifier] Failed to empty " << output_dir_ << ": " << ec.message() << std::endl;
    }
}

} // namespace cverify
