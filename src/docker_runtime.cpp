#include "docker_runtime.h"
#include <json/json.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <future>
#include <mutex>

namespace cverify {

namespace {

const char* DOCKER_BASE = "http://localhost";

bool parse_json(const std::string& body, Json::Value& root) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    return reader->parse(body.data(), body.data() + body.size(), &root, &errors);
}

// Holds a wait request open on its own thread
class DockerExitWatch : public ExitWatch {
public:
    DockerExitWatch(const HttpClient& http, std::string url) {
        std::future<void> armed = armed_.get_future();
        worker_ = std::thread([this, &http, url = std::move(url)] {
            HttpRequest request;
            request.method = "POST";
            request.url = url;
            request.on_headers = [this](long) { arm(); };
            request.cancel = &cancel_;
            response_ = http.perform(request);
            arm();
        });
        // The engine sends the headers once the wait is registered
        if (armed.wait_for(ARM_TIMEOUT) != std::future_status::ready) {
            std::cerr << "[Docker] Wait not acknowledged after " << ARM_TIMEOUT.count() << "s" << std::endl;
        }
    }

    ~DockerExitWatch() override {
        if (worker_.joinable()) {
            cancel_ = true;
            worker_.join();
        }
    }

    WaitResult wait() override {
        if (worker_.joinable()) {
            worker_.join();
        }
        return DockerRuntime::parse_wait_response(response_);
    }

private:
    static constexpr std::chrono::seconds ARM_TIMEOUT{30};

    void arm() {
        std::lock_guard<std::mutex> lock(arm_mutex_);
        if (!is_armed_) {
            is_armed_ = true;
            armed_.set_value();
        }
    }

    std::atomic<bool> cancel_{false};
    std::mutex arm_mutex_;
    bool is_armed_ = false;
    std::promise<void> armed_;
    HttpResponse response_;
    std::thread worker_;
};

} // namespace

DockerRuntime::DockerRuntime(const std::string& socket_path)
    : http_(socket_path, std::chrono::seconds(60)),
      wait_http_(socket_path, std::chrono::seconds(0)) {}

std::string DockerRuntime::error_of(const HttpResponse& response) {
    if (!response.transport_ok()) {
        return response.error;
    }
    Json::Value root;
    if (parse_json(response.body, root) && root.isObject() && root["message"].isString()) {
        return "HTTP " + std::to_string(response.status_code) + ": " + root["message"].asString();
    }
    return "HTTP " + std::to_string(response.status_code);
}

std::pair<std::string, std::string> DockerRuntime::split_image(const std::string& image) {
    size_t slash = image.rfind('/');
    size_t colon = image.rfind(':');
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {image, "latest"};
    }
    return {image.substr(0, colon), image.substr(colon + 1)};
}

std::string DockerRuntime::build_create_body(const ContainerSpec& spec) {
    Json::Value root(Json::objectValue);
    root["Image"] = spec.image;

    Json::Value cmd(Json::arrayValue);
    for (const auto& arg : spec.command) {
        cmd.append(arg);
    }
    root["Cmd"] = cmd;
    if (!spec.working_dir.empty()) {
        root["WorkingDir"] = spec.working_dir;
    }

    Json::Value host(Json::objectValue);
    Json::Value binds(Json::arrayValue);
    for (const auto& bind : spec.binds) {
        binds.append(bind);
    }
    host["Binds"] = binds;
    host["AutoRemove"] = spec.auto_remove;
    if (spec.memory_bytes > 0) {
        host["Memory"] = Json::Value::UInt64(spec.memory_bytes);
    }
    root["HostConfig"] = host;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

RuntimeStatus DockerRuntime::pull(const std::string& image) {
    auto [repo, tag] = split_image(image);
    std::string url = std::string(DOCKER_BASE) + "/images/create?fromImage=" + url_escape(repo) +
                      "&tag=" + url_escape(tag);

    HttpResponse response = wait_http_.post(url, "");
    if (!response.transport_ok() || response.status_code != 200) {
        return {false, error_of(response)};
    }
    std::string stream_error = pull_stream_error(response.body);
    if (!stream_error.empty()) {
        return {false, stream_error};
    }
    return {true, ""};
}

std::string DockerRuntime::pull_stream_error(const std::string& body) {
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        Json::Value message;
        if (line.find_first_not_of(" \t\r") == std::string::npos || !parse_json(line, message) ||
            !message.isObject()) {
            continue;
        }
        const Json::Value& detail = message["errorDetail"];
        if (detail.isObject() && detail["message"].isString()) {
            return detail["message"].asString();
        }
        if (message.isMember("error")) {
            return message["error"].isString() ? message["error"].asString() : "pull failed";
        }
    }
    return "";
}

CreateResult DockerRuntime::create(const ContainerSpec& spec) {
    CreateResult result;
    std::string url = std::string(DOCKER_BASE) + "/containers/create";
    if (!spec.name.empty()) {
        url += "?name=" + url_escape(spec.name);
    }

    HttpResponse response = http_.post(url, build_create_body(spec),
                                       {"Content-Type: application/json"});
    if (!response.transport_ok() || response.status_code != 201) {
        result.error = error_of(response);
        return result;
    }

    Json::Value root;
    if (!parse_json(response.body, root) || !root.isObject() || !root["Id"].isString()) {
        result.error = "create response lacks Id";
        return result;
    }
    result.ok = true;
    result.id = root["Id"].asString();
    std::cout << "[Docker] Created container " << result.id.substr(0, 12) << std::endl;
    return result;
}

RuntimeStatus DockerRuntime::start(const std::string& id) {
    HttpResponse response = http_.post(std::string(DOCKER_BASE) + "/containers/" + url_escape(id) + "/start", "");
    // 304: already started
    if (!response.transport_ok() || (response.status_code != 204 && response.status_code != 304)) {
        return {false, error_of(response)};
    }
    return {true, ""};
}

std::unique_ptr<ExitWatch> DockerRuntime::watch(const std::string& id, bool auto_remove) {
    // "removed" also fires when the container is removed without running
    std::string condition = auto_remove ? "removed" : "next-exit";
    return std::make_unique<DockerExitWatch>(
        wait_http_, std::string(DOCKER_BASE) + "/containers/" + url_escape(id) + "/wait?condition=" + condition);
}

WaitResult DockerRuntime::parse_wait_response(const HttpResponse& response) {
    WaitResult result;
    if (!response.transport_ok() || response.status_code != 200) {
        result.error = error_of(response);
        return result;
    }

    Json::Value root;
    if (!parse_json(response.body, root) || !root.isObject() || !root["StatusCode"].isIntegral()) {
        result.error = "wait response lacks StatusCode";
        return result;
    }
    const Json::Value& error = root["Error"];
    if (error.isObject() && error["Message"].isString() && !error["Message"].asString().empty()) {
        result.error = error["Message"].asString();
        return result;
    }

    result.ok = true;
    result.exit_code = root["StatusCode"].asInt64();
    return result;
}

RuntimeStatus DockerRuntime::remove(const std::string& name_or_id) {
    HttpResponse response = http_.del(
        std::string(DOCKER_BASE) + "/containers/" + url_escape(name_or_id) + "?force=true");
    if (response.transport_ok() && (response.status_code == 204 || response.status_code == 404)) {
        return {true, ""};
    }
    // 409: removal already in progress (auto-remove racing us)
    if (response.transport_ok() && response.status_code == 409) {
        return {true, ""};
    }
    return {false, error_of(response)};
}

} // namespace cverify
