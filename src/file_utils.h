#pragma once

#include <string>
#include <system_error>
#include <vector>
#include <cstdint>

namespace cverify {

class FileUtils {
public:
    static std::vector<uint8_t> sha256(const uint8_t* data, size_t len);

    // Read a whole file; throws std::runtime_error when it cannot be opened
    static std::vector<uint8_t> read_file(const std::string& filepath);

    // Write (truncate) a file, returns false on any I/O failure
    static bool write_file(const std::string& filepath, const std::string& content);

    // Delete everything inside a directory but keep the directory itself.
    // A missing directory is already clear. Returns false with ec set on failure.
    static bool clear_directory(const std::string& dirpath, std::error_code& ec);

    // Plain file name: [A-Za-z0-9._-]+, bounded length, not "." or ".."
    static bool is_safe_filename(const std::string& filename);
};

} // namespace cverify
