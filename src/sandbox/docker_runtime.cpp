#include "sandbox/docker_runtime.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace forge {

namespace {

// docker exits 125 when the daemon rejects the run, 126/127 when the command cannot start.
// The same codes come from the child itself when the docker binary cannot be executed.
// The program inside the container may also exit with them, so they only mean a setup
// failure when no container was created.
constexpr int DOCKER_DAEMON_ERROR = 125;
constexpr int COMMAND_NOT_EXECUTABLE = 126;
constexpr int COMMAND_NOT_FOUND = 127;

constexpr std::chrono::seconds TERMINATE_GRACE{2};

struct ProcessResult {
    std::string output;
    int exit_code = -1;
    bool timed_out = false;
};

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Drain whatever is readable on fd; returns false once the write end is closed
bool drain_pipe(int fd, std::string& output, size_t max_output_bytes, bool& truncated) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            size_t room = output.size() < max_output_bytes ? max_output_bytes - output.size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            output.append(buffer, take);
            if (take < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

bool wait_until(pid_t pid, int& status, std::chrono::steady_clock::time_point deadline) {
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0 && errno != EINTR) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

/**
 * @brief Run argv as a child process with stdout and stderr merged into one pipe
 * @param timeout Zero means wait indefinitely
 * @throws std::runtime_error if the pipe or the child cannot be created
 */
ProcessResult run_process(const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout,
                          size_t max_output_bytes) {
    int fds[2];
    if (::pipe(fds) != 0) {
        throw std::runtime_error("Failed to create pipe: " + std::string(std::strerror(errno)));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int error = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::runtime_error("Failed to fork: " + std::string(std::strerror(error)));
    }

    if (pid == 0) {
        ::close(fds[0]);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[1]);
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::execvp(argv[0], argv.data());
        const char* message = "exec failed: ";
        ssize_t ignored = ::write(STDERR_FILENO, message, std::strlen(message));
        const char* reason = std::strerror(errno);
        ignored = ::write(STDERR_FILENO, reason, std::strlen(reason));
        (void)ignored;
        ::_exit(errno == ENOENT ? COMMAND_NOT_FOUND : COMMAND_NOT_EXECUTABLE);
    }

    ::close(fds[1]);
    ::fcntl(fds[0], F_SETFL, ::fcntl(fds[0], F_GETFL) | O_NONBLOCK);

    ProcessResult result;
    bool truncated = false;
    bool pipe_open = true;
    bool finished = false;
    int status = 0;

    const auto start = std::chrono::steady_clock::now();
    while (true) {
        if (pipe_open) {
            struct pollfd pfd{fds[0], POLLIN, 0};
            if (::poll(&pfd, 1, 100) > 0) {
                pipe_open = drain_pipe(fds[0], result.output, max_output_bytes, truncated);
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            finished = true;
            break;
        }

        if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
            break;
        }
    }

    if (!finished) {
        result.timed_out = true;
        ::kill(pid, SIGTERM);
        if (!wait_until(pid, status, std::chrono::steady_clock::now() + TERMINATE_GRACE)) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &status, 0);
        }
    }

    // Collect what the child wrote before it exited
    if (pipe_open) {
        drain_pipe(fds[0], result.output, max_output_bytes, truncated);
    }
    ::close(fds[0]);

    if (truncated) {
        result.output += "\n[output truncated]";
    }

    result.exit_code = decode_status(status);
    return result;
}

} // namespace

DockerRuntime::DockerRuntime(const std::string& docker_binary)
    : docker_binary_(docker_binary) {
}

std::string DockerRuntime::cidfile_path(const std::string& container_name) {
    return (std::filesystem::temp_directory_path() / (container_name + ".cid")).string();
}

std::vector<std::string> DockerRuntime::build_run_arguments(const ContainerRunRequest& request) const {
    const std::string memory = std::to_string(request.limits.memory_limit_mb) + "m";

    std::vector<std::string> args = {
        docker_binary_, "run",
        "--name", request.container_name,
        "--cidfile", cidfile_path(request.container_name),
        "--memory", memory,
        "--memory-swap", memory,
        "--pids-limit", std::to_string(request.limits.pids_limit),
        "--read-only",
        "--security-opt", "no-new-privileges",
        "--cap-drop", "ALL",
        "-v", request.host_directory + ":/code:ro",
        "-w", "/code"
    };

    if (request.limits.network_disabled) {
        args.insert(args.begin() + 6, {"--network", "none"});
    }

    args.push_back(request.image);
    args.push_back(request.interpreter);
    args.push_back(request.source_file_name);
    return args;
}

ContainerRunResult DockerRuntime::run_isolated(const ContainerRunRequest& request) {
    std::cout << "[SANDBOX] Starting container " << request.container_name
              << " (" << request.image << ", " << request.limits.memory_limit_mb << "m, "
              << request.limits.timeout_seconds << "s)" << std::endl;

    // docker refuses to start when the cidfile already exists
    const std::string cidfile = cidfile_path(request.container_name);
    std::error_code ec;
    std::filesystem::remove(cidfile, ec);

    ProcessResult process = run_process(build_run_arguments(request),
                                        std::chrono::seconds(request.limits.timeout_seconds),
                                        request.max_output_bytes);

    const bool container_created = std::filesystem::exists(cidfile, ec) &&
                                   std::filesystem::file_size(cidfile, ec) > 0;
    std::filesystem::remove(cidfile, ec);

    if (process.timed_out) {
        std::cout << "[SANDBOX] Deadline reached, removing " << request.container_name << std::endl;
        try {
            remove(request.container_name);
        } catch (const std::exception& e) {
            std::cerr << "[SANDBOX] Failed to remove timed-out container: " << e.what() << std::endl;
        }
    } else if (!container_created &&
               (process.exit_code == DOCKER_DAEMON_ERROR ||
                process.exit_code == COMMAND_NOT_EXECUTABLE ||
                process.exit_code == COMMAND_NOT_FOUND)) {
        throw std::runtime_error("docker run failed (exit " + std::to_string(process.exit_code) + "): " +
                                 process.output);
    }

    ContainerRunResult result;
    result.output = std::move(process.output);
    result.timed_out = process.timed_out;
    result.exit_code = process.exit_code;
    return result;
}

void DockerRuntime::remove(const std::string& container_name) {
    ProcessResult process = run_process({docker_binary_, "rm", "-f", container_name},
                                        std::chrono::seconds(30), 64 * 1024);

    if (process.timed_out) {
        throw std::runtime_error("docker rm timed out for " + container_name);
    }

    if (process.exit_code == COMMAND_NOT_FOUND || process.exit_code == COMMAND_NOT_EXECUTABLE) {
        throw std::runtime_error("Failed to invoke " + docker_binary_ + ": " + process.output);
    }

    // A container that never started is already gone
    if (process.exit_code != 0 && process.output.find("No such container") == std::string::npos) {
        std::cerr << "[SANDBOX] docker rm -f " << container_name << " exited with "
                  << process.exit_code << ": " << process.output << std::endl;
    }
}

} // namespace forge
