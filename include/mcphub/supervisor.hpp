#pragma once
#include "package_catalog.hpp"
#include "session.hpp"
#include "types.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcphub {

/// Per-launch execution context merged into the package's launch spec.
struct LaunchContext {
    std::optional<std::string> working_dir;
    std::map<std::string, std::string> env;
};

/// Registry of running peer processes, keyed by logical name.
///
/// One lock guards the whole registry and is never held across a blocking
/// wait on a child or a peer. Each entry owns its child process and the
/// Session speaking to it.
class Supervisor {
public:
    struct Options {
        PackageCatalog catalog = PackageCatalog::defaults();
        Session::Options session;
        std::size_t worker_threads = 4;
        std::chrono::milliseconds request_timeout{30000};
    };

    Supervisor();
    explicit Supervisor(Options opts);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // ---- Lifecycle ----

    /// Spawn the package `name`. Throws McpConfigError for an unknown package,
    /// McpAlreadyRunningError if `name` is tracked, McpSpawnError if the
    /// command cannot be executed.
    ServerStatus start(const std::string& name, HostingMode mode);
    ServerStatus start(const std::string& name, HostingMode mode, const LaunchContext& context);

    /// Kill and reap. Throws McpNotFoundError if `server_id` is not tracked.
    void stop(const std::string& server_id);

    /// Kill and reap everything; failures are logged, never thrown.
    void stop_all();

    /// Check every entry. Entries found dead are reported once and dropped.
    [[nodiscard]] std::vector<ServerStatus> get_servers();

    [[nodiscard]] bool is_tracked(const std::string& server_id) const;
    [[nodiscard]] std::size_t size() const;

    // ---- Peer calls (run on the worker pool with a deadline) ----

    nlohmann::json initialize(const std::string& server_id,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Performs the handshake first if needed.
    nlohmann::json list_tools(const std::string& server_id,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Performs the handshake first if needed.
    nlohmann::json call_tool(const std::string& server_id,
                             const std::string& tool,
                             const nlohmann::json& arguments = nlohmann::json::object(),
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] const PackageCatalog& catalog() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcphub
