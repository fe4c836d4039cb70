#include "mcphub/supervisor.hpp"
#include "mcphub/error.hpp"
#include "mcphub/log.hpp"
#include "mcphub/process.hpp"
#include "mcphub/worker_pool.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace mcphub {

namespace {

// Lifecycle of one call on the worker pool. A call abandoned before a worker
// picks it up never touches its Session.
enum class CallState { Queued, Running, Abandoned };

struct TrackedProcess {
    std::string name;
    HostingMode mode{HostingMode::HubHosted};
    std::chrono::system_clock::time_point started_at;
    std::unique_ptr<ChildProcess> child;
    // Shared only with worker threads mid-call, so a call can be woken after removal.
    std::shared_ptr<Session> session;
    bool suspect{false};
    std::string suspect_reason;
};

ServerStatus base_status(const std::string& id, const TrackedProcess& proc) {
    ServerStatus status;
    status.id = id;
    status.name = proc.name;
    status.mode = proc.mode;
    status.started_at = proc.started_at;
    return status;
}

void shutdown_session(const std::string& id, Session& session) {
    try {
        session.shutdown();
    } catch (const McpTransportError& e) {
        log::warn("Failed to shut down session for '{}': {}", id, e.what());
    }
}

} // anonymous namespace

// ----------- Supervisor::Impl -----------

struct Supervisor::Impl {
    Options opts;

    mutable std::mutex mutex;
    std::map<std::string, TrackedProcess> processes;

    WorkerPool pool;

    explicit Impl(Options o) : opts(std::move(o)), pool(opts.worker_threads) {}

    // Kill and reap one removed entry. Reaping is attempted even when the
    // kill fails; the kill failure is reported afterwards.
    void terminate(const std::string& id, TrackedProcess& proc) {
        shutdown_session(id, *proc.session);

        std::string kill_error;
        try {
            proc.child->kill();
        } catch (const std::system_error& e) {
            kill_error = e.what();
        }

        try {
            if (kill_error.empty()) {
                proc.child->wait();
            } else if (!proc.child->try_wait()) {
                // Never block on a child we could not signal.
                log::error("Server '{}' (pid {}) could not be killed and is still running",
                           id, proc.child->pid());
            }
        } catch (const std::system_error& e) {
            log::warn("Failed to reap '{}' (pid {}): {}", id, proc.child->pid(), e.what());
        }

        if (!kill_error.empty()) {
            throw McpError("Failed to kill " + id + ": " + kill_error);
        }
        log::info("Stopped '{}'", id);
    }

    void mark_suspect(const std::string& id, const std::shared_ptr<Session>& session,
                      const std::string& reason) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = processes.find(id);
        // The entry may have been restarted meanwhile; only flag the session that failed.
        if (it != processes.end() && it->second.session == session) {
            it->second.suspect = true;
            it->second.suspect_reason = reason;
        }
    }

    template <typename Fn>
    nlohmann::json run_call(const std::string& id, const std::string& what,
                            std::optional<std::chrono::milliseconds> timeout, Fn fn) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = processes.find(id);
            if (it == processes.end()) {
                throw McpNotFoundError("No running server with id '" + id + "'");
            }
            if (it->second.suspect) {
                throw McpTransportError("Server '" + id + "' is unusable after an earlier failure ("
                                        + it->second.suspect_reason + "); restart it");
            }
            session = it->second.session;
        }

        auto deadline = timeout.value_or(opts.request_timeout);
        auto state = std::make_shared<std::atomic<CallState>>(CallState::Queued);
        std::future<nlohmann::json> fut = pool.submit([session, fn, state]() {
            auto expected = CallState::Queued;
            if (!state->compare_exchange_strong(expected, CallState::Running)) {
                throw McpTimeoutError("Call abandoned before it started");
            }
            return fn(*session);
        });

        if (fut.wait_for(deadline) == std::future_status::timeout) {
            auto expected = CallState::Queued;
            if (state->compare_exchange_strong(expected, CallState::Abandoned)) {
                // No worker was free; the session was never used.
                log::warn("{} on '{}' timed out after {} ms waiting for a free worker",
                          what, id, deadline.count());
                throw McpTimeoutError("Request timed out: " + what + " on '" + id + "' after "
                                      + std::to_string(deadline.count())
                                      + " ms waiting for a free worker");
            }
            // The worker stays blocked on the peer until the entry is stopped.
            mark_suspect(id, session, "request timed out");
            log::warn("{} on '{}' timed out after {} ms", what, id, deadline.count());
            throw McpTimeoutError("Request timed out: " + what + " on '" + id + "' after "
                                  + std::to_string(deadline.count()) + " ms");
        }

        try {
            return fut.get();
        } catch (const McpTransportError& e) {
            mark_suspect(id, session, e.what());
            throw;
        } catch (const McpParseError& e) {
            mark_suspect(id, session, e.what());
            throw;
        }
    }
};

// ----------- Supervisor -----------

Supervisor::Supervisor()
    : Supervisor(Options{}) {}

Supervisor::Supervisor(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

Supervisor::~Supervisor() {
    stop_all();
    impl_->pool.shutdown();
}

ServerStatus Supervisor::start(const std::string& name, HostingMode mode) {
    return start(name, mode, LaunchContext{});
}

ServerStatus Supervisor::start(const std::string& name, HostingMode mode,
                               const LaunchContext& context) {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (impl_->processes.count(name) > 0) {
        throw McpAlreadyRunningError("Server '" + name + "' is already running");
    }

    const PackageSpec& package = impl_->opts.catalog.resolve(name);

    LaunchSpec launch = package.launch;
    if (context.working_dir) launch.working_dir = context.working_dir;
    for (const auto& [key, value] : context.env) {
        launch.env[key] = value;
    }

    std::unique_ptr<ChildProcess> child;
    try {
        child = ChildProcess::spawn(launch);
    } catch (const McpSpawnError& e) {
        throw McpSpawnError("Failed to start " + package.display_name + ": " + e.what());
    }

    TrackedProcess proc;
    proc.name = package.display_name;
    proc.mode = mode;
    proc.started_at = std::chrono::system_clock::now();
    proc.session = std::make_shared<Session>(child->take_transport(), impl_->opts.session);
    proc.child = std::move(child);

    ServerStatus status = base_status(name, proc);
    status.status = ServerState::Running;
    status.pid = proc.child->pid();

    log::info("Started '{}' ({}) as pid {} [{}]", name, proc.name, proc.child->pid(),
              hosting_mode_to_string(mode));
    impl_->processes.emplace(name, std::move(proc));
    return status;
}

void Supervisor::stop(const std::string& server_id) {
    decltype(impl_->processes)::node_type node;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->processes.find(server_id);
        if (it == impl_->processes.end()) {
            throw McpNotFoundError("No running server with id '" + server_id + "'");
        }
        node = impl_->processes.extract(it);
    }
    impl_->terminate(server_id, node.mapped());
}

void Supervisor::stop_all() {
    std::map<std::string, TrackedProcess> drained;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        drained.swap(impl_->processes);
    }

    std::size_t failures = 0;
    for (auto& [id, proc] : drained) {
        try {
            impl_->terminate(id, proc);
        } catch (const std::exception& e) {
            ++failures;
            log::error("Failed to stop '{}': {}", id, e.what());
        }
    }
    if (failures > 0) {
        log::warn("stop_all finished with {} of {} servers not cleanly terminated",
                  failures, drained.size());
    }
}

std::vector<ServerStatus> Supervisor::get_servers() {
    std::vector<ServerStatus> result;
    std::vector<decltype(impl_->processes)::node_type> dead;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        std::vector<std::string> exited;

        for (auto& [id, proc] : impl_->processes) {
            ServerStatus status = base_status(id, proc);
            try {
                if (auto exit_status = proc.child->try_wait()) {
                    status.status = ServerState::Stopped;
                    status.error = "Process exited unexpectedly (" + describe_exit_status(*exit_status) + ")";
                    exited.push_back(id);
                } else {
                    status.status = ServerState::Running;
                    status.pid = proc.child->pid();
                }
            } catch (const std::system_error& e) {
                status.status = ServerState::Error;
                status.error = std::string("Status check failed: ") + e.what();
            }
            result.push_back(std::move(status));
        }

        for (const auto& id : exited) {
            dead.push_back(impl_->processes.extract(id));
        }
    }

    for (auto& node : dead) {
        log::warn("Server '{}' exited unexpectedly; removed from registry", node.key());
        shutdown_session(node.key(), *node.mapped().session);
    }
    return result;
}

bool Supervisor::is_tracked(const std::string& server_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->processes.count(server_id) > 0;
}

std::size_t Supervisor::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->processes.size();
}

nlohmann::json Supervisor::initialize(const std::string& server_id,
                                      std::optional<std::chrono::milliseconds> timeout) {
    return impl_->run_call(server_id, "initialize", timeout,
                           [](Session& s) { return s.initialize(); });
}

nlohmann::json Supervisor::list_tools(const std::string& server_id,
                                      std::optional<std::chrono::milliseconds> timeout) {
    return impl_->run_call(server_id, "tools/list", timeout, [](Session& s) {
        s.initialize();
        return s.list_tools();
    });
}

nlohmann::json Supervisor::call_tool(const std::string& server_id,
                                     const std::string& tool,
                                     const nlohmann::json& arguments,
                                     std::optional<std::chrono::milliseconds> timeout) {
    return impl_->run_call(server_id, "tools/call " + tool, timeout,
                           [tool, arguments](Session& s) {
                               s.initialize();
                               return s.call_tool(tool, arguments);
                           });
}

const PackageCatalog& Supervisor::catalog() const {
    return impl_->opts.catalog;
}

} // namespace mcphub
