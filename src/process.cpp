#include "mcphub/process.hpp"
#include "mcphub/error.hpp"
#include "mcphub/log.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

extern char** environ;

namespace mcphub {

namespace {

struct Pipe {
    int fds[2]{-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            throw McpSpawnError(std::string("Failed to create pipe: ") + std::strerror(errno));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }
    int release_read() { int fd = fds[0]; fds[0] = -1; return fd; }
    int release_write() { int fd = fds[1]; fds[1] = -1; return fd; }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_argv(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) out.push_back(s.data());
    out.push_back(nullptr);
    return out;
}

// dup2() onto the same descriptor does nothing, so a pipe end that already
// sits on the target keeps O_CLOEXEC unless it is cleared here.
bool redirect(int fd, int target) {
    if (fd == target) {
        return ::fcntl(target, F_SETFD, 0) == 0;
    }
    return ::dup2(fd, target) >= 0;
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const Pipe& in, const Pipe& out, int status_fd,
                             const char* cwd, const char* file,
                             char* const* argv, char* const* envp) {
    if (!redirect(in.read_end(), STDIN_FILENO) || !redirect(out.write_end(), STDOUT_FILENO)) {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        _exit(127);
    }
    if (cwd && ::chdir(cwd) < 0) {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        _exit(127);
    }
    if (envp) {
        ::execvpe(file, argv, envp);
    } else {
        ::execvp(file, argv);
    }
    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    _exit(127);
}

} // anonymous namespace

std::string describe_exit_status(int status) {
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return std::string("killed by signal ") + std::to_string(WTERMSIG(status))
               + " (" + ::strsignal(WTERMSIG(status)) + ")";
    }
    return "status " + std::to_string(status);
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const LaunchSpec& spec) {
    if (spec.command.empty()) {
        throw McpSpawnError("Failed to start: empty command");
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> arg_strings;
    arg_strings.push_back(spec.command);
    arg_strings.insert(arg_strings.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = to_argv(arg_strings);

    std::vector<std::string> env_strings;
    std::vector<char*> envp;
    if (!spec.env.empty()) {
        env_strings = build_environment(spec.env);
        envp = to_argv(env_strings);
    }
    const char* cwd = spec.working_dir ? spec.working_dir->c_str() : nullptr;

    Pipe child_stdin;
    Pipe child_stdout;
    Pipe status;

    pid_t pid = ::fork();
    if (pid < 0) {
        throw McpSpawnError("Failed to start " + spec.command + ": fork failed: " + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(child_stdin, child_stdout, status.write_end(), cwd, argv[0],
                   argv.data(), envp.empty() ? nullptr : envp.data());
    }

    child_stdin.close_read();
    child_stdout.close_write();
    status.close_write();

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status.read_end(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
        throw McpSpawnError("Failed to start " + spec.command + ": " + std::strerror(child_errno));
    }

    log::debug("Spawned '{}' as pid {}", spec.command, pid);
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, child_stdout.release_read(), child_stdin.release_write()));
}

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stdin_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stdin_fd_(stdin_fd) {}

ChildProcess::~ChildProcess() {
    if (stdout_fd_ >= 0) ::close(stdout_fd_);
    if (stdin_fd_ >= 0)  ::close(stdin_fd_);
    if (reaped_) return;

    int wstatus = 0;
    if (::kill(pid_, SIGKILL) < 0 && errno != ESRCH) {
        // The child may still be running, so a blocking reap could never return.
        int err = errno;
        if (::waitpid(pid_, &wstatus, WNOHANG) == 0) {
            log::error("Leaking pid {}: could not be killed on release: {}", pid_, std::strerror(err));
        }
        return;
    }
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        log::warn("Failed to reap pid {} on release: {}", pid_, std::strerror(errno));
    }
}

std::optional<int> ChildProcess::try_wait() {
    if (reaped_) return exit_status_;

    int wstatus = 0;
    pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
    if (r < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    if (r == 0) return std::nullopt;

    reaped_ = true;
    exit_status_ = wstatus;
    return exit_status_;
}

void ChildProcess::kill() {
    if (reaped_) return;
    if (::kill(pid_, SIGKILL) < 0) {
        throw std::system_error(errno, std::generic_category(), "kill");
    }
}

int ChildProcess::wait() {
    if (reaped_) return exit_status_.value_or(0);

    int wstatus = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, 0);
    } while (r < 0 && errno == EINTR);

    reaped_ = true;
    if (r < 0) {
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }
    exit_status_ = wstatus;
    return wstatus;
}

std::unique_ptr<StdioTransport> ChildProcess::take_transport() {
    if (stdout_fd_ < 0 || stdin_fd_ < 0) {
        throw McpContractError("Child process pipes were already taken");
    }
    auto transport = std::make_unique<StdioTransport>(stdout_fd_, stdin_fd_);
    stdout_fd_ = -1;
    stdin_fd_ = -1;
    return transport;
}

} // namespace mcphub
