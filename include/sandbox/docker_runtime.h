#pragma once

#include "interfaces/container_runtime_interface.h"
#include <string>
#include <vector>

namespace forge {

/**
 * @brief Container runtime backed by the docker command-line client
 *
 * Each run is a child `docker run` process whose merged stdout/stderr is
 * collected through a pipe. The wall-clock deadline is enforced here: on
 * expiry the client is sent SIGTERM, then SIGKILL, and the container is
 * force-removed.
 */
class DockerRuntime : public IContainerRuntime {
public:
    explicit DockerRuntime(const std::string& docker_binary = "docker");
    ~DockerRuntime() override = default;

    ContainerRunResult run_isolated(const ContainerRunRequest& request) override;
    void remove(const std::string& container_name) override;

    // Full argv for `docker run`, including the binary
    std::vector<std::string> build_run_arguments(const ContainerRunRequest& request) const;

    // Host file docker writes the container id to once the container exists
    static std::string cidfile_path(const std::string& container_name);

private:
    std::string docker_binary_;
};

} // namespace forge
