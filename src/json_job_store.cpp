#include "json_job_store.h"
#include <json/json.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cverify {

namespace {

Json::Value read_document(const std::string& path, Json::ValueType empty_type) {
    if (!fs::exists(path)) {
        return Json::Value(empty_type);
    }

    std::ifstream in(path);
    if (!in) {
        throw StoreError("cannot open " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw StoreError("corrupt document " + path + ": " + errors);
    }
    return root;
}

void write_document(const std::string& path, const Json::Value& root) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw StoreError("cannot write " + tmp_path);
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        out << Json::writeString(builder, root);
        out.close();
        if (out.fail()) {
            throw StoreError("short write to " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        throw StoreError("cannot replace " + path + ": " + ec.message());
    }
}

// Field type mismatches surface from jsoncpp as Json::LogicError
template <typename Parse>
auto parse_or_throw(const std::string& path, Parse parse) -> decltype(parse()) {
    try {
        return parse();
    } catch (const std::invalid_argument& e) {
        throw StoreError("bad document " + path + ": " + e.what());
    } catch (const Json::Exception& e) {
        throw StoreError("bad document " + path + ": " + e.what());
    }
}

} // namespace

bool JsonFileJobStore::FileStamp::operator==(const FileStamp& other) const {
    return exists == other.exists && inode == other.inode &&
           size == other.size && mtime_ns == other.mtime_ns;
}

JsonFileJobStore::FileLock::FileLock(int fd) : fd_(fd) {
    while (flock(fd_, LOCK_EX) != 0) {
        if (errno != EINTR) {
            throw StoreError(std::string("cannot lock store: ") + strerror(errno));
        }
    }
}

JsonFileJobStore::FileLock::~FileLock() {
    flock(fd_, LOCK_UN);
}

JsonFileJobStore::JsonFileJobStore(const std::string& directory)
    : directory_(directory),
      jobs_path_(directory + "/jobs.json"),
      sources_path_(directory + "/sources.json") {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StoreError("cannot create store directory " + directory_ + ": " + ec.message());
    }

    std::string lock_path = directory_ + "/store.lock";
    lock_fd_ = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (lock_fd_ < 0) {
        throw StoreError("cannot open " + lock_path + ": " + strerror(errno));
    }

    try {
        FileLock lock(lock_fd_);
        refresh();
    } catch (const StoreError&) {
        close(lock_fd_);
        throw;
    }
    std::cout << "[Store] Loaded " << jobs_.size() << " jobs from " << directory_ << std::endl;
}

JsonFileJobStore::~JsonFileJobStore() {
    if (lock_fd_ >= 0) {
        close(lock_fd_);
    }
}

JsonFileJobStore::FileStamp JsonFileJobStore::stamp_of(const std::string& path) {
    FileStamp stamp;
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            return stamp;
        }
        throw StoreError("cannot stat " + path + ": " + strerror(errno));
    }
    stamp.exists = true;
    stamp.inode = st.st_ino;
    stamp.size = st.st_size;
    stamp.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000 + st.st_mtim.tv_nsec;
    return stamp;
}

void JsonFileJobStore::refresh() {
    FileStamp jobs_stamp = stamp_of(jobs_path_);
    if (jobs_stamp != jobs_stamp_) {
        Json::Value root = read_document(jobs_path_, Json::objectValue);
        jobs_ = parse_or_throw(jobs_path_, [&root] {
            if (!root.isObject()) {
                throw std::invalid_argument("top level must be an object");
            }
            JobMap jobs;
            for (const auto& address : root.getMemberNames()) {
                jobs[address] = job_from_json(root[address]);
            }
            return jobs;
        });
        jobs_stamp_ = jobs_stamp;
    }

    FileStamp sources_stamp = stamp_of(sources_path_);
    if (sources_stamp != sources_stamp_) {
        Json::Value root = read_document(sources_path_, Json::arrayValue);
        files_ = parse_or_throw(sources_path_, [&root] {
            if (!root.isArray()) {
                throw std::invalid_argument("top level must be an array");
            }
            FileMap files;
            for (const auto& entry : root) {
                SourceFile file = source_file_from_json(entry);
                files[file.address][file.filename] = file;
            }
            return files;
        });
        sources_stamp_ = sources_stamp;
    }
}

void JsonFileJobStore::commit_jobs(JobMap jobs) {
    Json::Value root(Json::objectValue);
    for (const auto& [address, job] : jobs) {
        root[address] = job_to_json(job);
    }
    write_document(jobs_path_, root);
    jobs_ = std::move(jobs);
    jobs_stamp_ = stamp_of(jobs_path_);
}

void JsonFileJobStore::commit_sources(FileMap files) {
    Json::Value root(Json::arrayValue);
    for (const auto& [address, by_name] : files) {
        for (const auto& [name, file] : by_name) {
            root.append(source_file_to_json(file));
        }
    }
    write_document(sources_path_, root);
    files_ = std::move(files);
    sources_stamp_ = stamp_of(sources_path_);
}

std::optional<VerificationJob> JsonFileJobStore::next_queued() {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    return select_next_queued(jobs_);
}

std::optional<VerificationJob> JsonFileJobStore::get_job(const std::string& address) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    auto it = jobs_.find(address);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void JsonFileJobStore::put_job(const VerificationJob& job) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    JobMap jobs = jobs_;
    jobs[job.address] = job;
    commit_jobs(std::move(jobs));
}

bool JsonFileJobStore::set_status(const std::string& address, JobStatus status) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    if (jobs_.count(address) == 0) {
        return false;
    }
    JobMap jobs = jobs_;
    jobs[address].status = status;
    commit_jobs(std::move(jobs));
    return true;
}

bool JsonFileJobStore::record_success(const std::string& address, const SuccessRecord& record) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    if (jobs_.count(address) == 0) {
        return false;
    }
    JobMap jobs = jobs_;
    apply_success(jobs[address], record);
    commit_jobs(std::move(jobs));
    return true;
}

std::vector<SourceFile> JsonFileJobStore::source_files(const std::string& address) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    std::vector<SourceFile> result;
    auto it = files_.find(address);
    if (it != files_.end()) {
        for (const auto& [name, file] : it->second) {
            result.push_back(file);
        }
    }
    return result;
}

size_t JsonFileJobStore::count_source_files(const std::string& address) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    auto it = files_.find(address);
    return it == files_.end() ? 0 : it->second.size();
}

void JsonFileJobStore::put_source_file(const SourceFile& file) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    FileMap files = files_;
    files[file.address][file.filename] = file;
    commit_sources(std::move(files));
}

void JsonFileJobStore::delete_source_files(const std::string& address) {
    std::lock_guard<std::mutex> guard(mutex_);
    FileLock lock(lock_fd_);
    refresh();
    if (files_.count(address) == 0) {
        return;
    }
    FileMap files = files_;
    files.erase(address);
    commit_sources(std::move(files));
}

} // namespace cverify
