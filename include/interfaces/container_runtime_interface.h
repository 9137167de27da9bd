#pragma once

#include <cstddef>
#include <string>

namespace forge {

struct ContainerLimits {
    int memory_limit_mb = 128;
    int timeout_seconds = 30;
    int pids_limit = 64;
    bool network_disabled = true;
};

struct ContainerRunRequest {
    std::string container_name;   // Unique per run
    std::string host_directory;   // Mounted read-only as the working directory
    std::string source_file_name; // File inside host_directory to run
    std::string image;
    std::string interpreter;
    ContainerLimits limits;
    size_t max_output_bytes = 1024 * 1024;
};

struct ContainerRunResult {
    std::string output;           // Combined stdout and stderr
    bool timed_out = false;
    int exit_code = -1;
};

/**
 * @brief Interface for running one file inside an isolated container
 */
class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    /**
     * @brief Run the request's source file to completion or until the deadline
     * @return Collected output and how the process ended
     * @throws std::runtime_error if the container could not be started
     */
    virtual ContainerRunResult run_isolated(const ContainerRunRequest& request) = 0;

    /**
     * @brief Force-remove a container by name; a missing container is not an error
     * @throws std::runtime_error if the runtime itself could not be invoked
     */
    virtual void remove(const std::string& container_name) = 0;
};

} // namespace forge
