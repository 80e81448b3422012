#include "file_utils.h"
#include "constants.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <openssl/sha.h>

namespace cverify {

namespace fs = std::filesystem;

std::vector<uint8_t> FileUtils::sha256(const uint8_t* data, size_t len) {
    std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
    SHA256(data, len, digest.data());
    return digest;
}

std::vector<uint8_t> FileUtils::read_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
}

bool FileUtils::write_file(const std::string& filepath, const std::string& content) {
    std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    return !out.fail();
}

bool FileUtils::clear_directory(const std::string& dirpath, std::error_code& ec) {
    ec.clear();
    if (!fs::exists(dirpath, ec)) {
        return !ec;
    }
    fs::directory_iterator it(dirpath, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        fs::remove_all(it->path(), ec);
        if (ec) {
            return false;
        }
    }
    return !ec;
}

bool FileUtils::is_safe_filename(const std::string& filename) {
    if (filename.empty() || filename.size() > MAX_FILENAME_LENGTH) {
        return false;
    }
    if (filename == "." || filename == "..") {
        return false;
    }
    for (char c : filename) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

} // namespace cverify
