#pragma once
#include "transport/stdio_transport.hpp"
#include <sys/types.h>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

/// What to execute for one peer.
struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> working_dir;
    std::map<std::string, std::string> env;   // added to / overriding the inherited environment
};

/// A forked child with piped stdin/stdout and inherited stderr.
///
/// A child still running when its handle is destroyed is killed and reaped.
/// If the kill is refused the destructor does not wait; the pid is logged and left.
class ChildProcess {
public:
    /// Throws McpSpawnError if the command cannot be executed.
    [[nodiscard]] static std::unique_ptr<ChildProcess> spawn(const LaunchSpec& spec);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const { return pid_; }

    /// Non-blocking check. Returns the exit status once the child has exited.
    /// Throws std::system_error if the status cannot be queried.
    [[nodiscard]] std::optional<int> try_wait();

    /// SIGKILL the child. No-op once it has been reaped.
    /// Throws std::system_error on failure.
    void kill();

    /// Block until the child exits and return its status.
    /// Throws std::system_error; the handle is released either way.
    int wait();

    /// The child's stdout (read side) and stdin (write side). Available once.
    [[nodiscard]] std::unique_ptr<StdioTransport> take_transport();

private:
    ChildProcess(pid_t pid, int stdout_fd, int stdin_fd);

    pid_t pid_;
    int stdout_fd_;
    int stdin_fd_;
    bool reaped_{false};
    std::optional<int> exit_status_;
};

/// Human-readable form of a waitpid() status.
std::string describe_exit_status(int status);

} // namespace mcphub
