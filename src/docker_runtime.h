#pragma once

#include "container_runtime.h"
#include "http_client.h"
#include <string>
#include <utility>

namespace cverify {

// Docker Engine API over its UNIX socket
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(const std::string& socket_path = "/var/run/docker.sock");

    RuntimeStatus pull(const std::string& image) override;
    CreateResult create(const ContainerSpec& spec) override;
    std::unique_ptr<ExitWatch> watch(const std::string& id, bool auto_remove) override;
    RuntimeStatus start(const std::string& id) override;
    RuntimeStatus remove(const std::string& name_or_id) override;

    // JSON body of POST /containers/create
    static std::string build_create_body(const ContainerSpec& spec);

    // "repo:tag" split the way the engine expects it; tag defaults to "latest"
    static std::pair<std::string, std::string> split_image(const std::string& image);

    // Outcome of POST /containers/{id}/wait
    static WaitResult parse_wait_response(const HttpResponse& response);

    // Image pulls answer 200 and report failure inside the progress stream;
    // returns the first error message found, empty when there is none
    static std::string pull_stream_error(const std::string& body);

private:
    static std::string error_of(const HttpResponse& response);

    HttpClient http_;
    // Build containers can run for a long time; waits use their own client
    HttpClient wait_http_;
};

} // namespace cverify
