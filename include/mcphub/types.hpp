#pragma once
#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphub {

/// Who owns the peer's lifecycle.
enum class HostingMode {
    ToolLaunched,   // an AI tool spawns the server; the hub only observes
    HubHosted       // the hub starts and stops the server
};

std::string hosting_mode_to_string(HostingMode mode);
/// Throws McpConfigError for anything but tool_launched / hub_hosted.
HostingMode hosting_mode_from_string(const std::string& s);

void to_json(nlohmann::json& j, HostingMode mode);
void from_json(const nlohmann::json& j, HostingMode& mode);

enum class ServerState {
    Stopped,
    Running,
    Error
};

std::string server_state_to_string(ServerState state);

void to_json(nlohmann::json& j, ServerState state);

/// Snapshot of one tracked server, computed on demand.
struct ServerStatus {
    std::string id;
    std::string name;
    HostingMode mode{HostingMode::HubHosted};
    ServerState status{ServerState::Stopped};
    std::optional<pid_t> pid;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const ServerStatus& s);

/// ISO-8601 UTC with second precision, e.g. 2026-10-19T08:15:00Z.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

struct HealthSummary {
    std::size_t running{0};
    std::size_t stopped{0};
    std::size_t error{0};
};

[[nodiscard]] HealthSummary summarize(const std::vector<ServerStatus>& servers);

void to_json(nlohmann::json& j, const HealthSummary& s);

} // namespace mcphub
