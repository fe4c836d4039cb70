#include "mcphub/types.hpp"
#include "mcphub/error.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <ctime>

namespace mcphub {

// ---------- HostingMode ----------

std::string hosting_mode_to_string(HostingMode mode) {
    switch (mode) {
        case HostingMode::ToolLaunched: return "tool_launched";
        case HostingMode::HubHosted:    return "hub_hosted";
    }
    return "hub_hosted";
}

HostingMode hosting_mode_from_string(const std::string& s) {
    if (s == "tool_launched") return HostingMode::ToolLaunched;
    if (s == "hub_hosted")    return HostingMode::HubHosted;
    throw McpConfigError("Unknown MCP server mode '" + s + "'. Valid: tool_launched, hub_hosted");
}

void to_json(nlohmann::json& j, HostingMode mode) {
    j = hosting_mode_to_string(mode);
}

void from_json(const nlohmann::json& j, HostingMode& mode) {
    mode = hosting_mode_from_string(j.get<std::string>());
}

// ---------- ServerState ----------

std::string server_state_to_string(ServerState state) {
    switch (state) {
        case ServerState::Stopped: return "stopped";
        case ServerState::Running: return "running";
        case ServerState::Error:   return "error";
    }
    return "error";
}

void to_json(nlohmann::json& j, ServerState state) {
    j = server_state_to_string(state);
}

// ---------- ServerStatus ----------

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

void to_json(nlohmann::json& j, const ServerStatus& s) {
    j = {
        {"id", s.id},
        {"name", s.name},
        {"mode", s.mode},
        {"status", s.status},
        {"pid", nullptr},
        {"started_at", nullptr},
        {"error", nullptr}
    };
    if (s.pid) j["pid"] = *s.pid;
    if (s.started_at) j["started_at"] = format_timestamp(*s.started_at);
    if (s.error) j["error"] = *s.error;
}

// ---------- HealthSummary ----------

HealthSummary summarize(const std::vector<ServerStatus>& servers) {
    HealthSummary summary;
    for (const auto& s : servers) {
        switch (s.status) {
            case ServerState::Running: ++summary.running; break;
            case ServerState::Stopped: ++summary.stopped; break;
            case ServerState::Error:   ++summary.error;   break;
        }
    }
    return summary;
}

void to_json(nlohmann::json& j, const HealthSummary& s) {
    j = {{"hub_running", s.running}, {"hub_stopped", s.stopped}, {"hub_error", s.error}};
}

} // namespace mcphub
