#pragma once
#include "process.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcphub {

/// A logical package the hub knows how to launch.
struct PackageSpec {
    std::string id;
    std::string display_name;
    LaunchSpec launch;
};

void from_json(const nlohmann::json& j, PackageSpec& p);

/// Lookup table from logical package name to launch command.
///
/// Config file shape:
///   {"packages": [{"id": "core", "name": "@aidd.md/mcp-core",
///                  "command": "npx", "args": ["-y", "@aidd.md/mcp-core"],
///                  "cwd": "/opt/project", "env": {"NODE_ENV": "production"}}]}
class PackageCatalog {
public:
    PackageCatalog() = default;

    /// monolithic, core, memory and tools, each run through `npx -y`.
    [[nodiscard]] static PackageCatalog defaults();

    /// Entries from a parsed config document, on top of an empty catalog.
    /// Throws McpConfigError on an invalid shape.
    [[nodiscard]] static PackageCatalog from_json(const nlohmann::json& config);

    /// Defaults overlaid with the entries of the file at `path`.
    /// Throws McpConfigError if the file cannot be read or parsed.
    [[nodiscard]] static PackageCatalog load_file(const std::string& path);

    /// Register a package, replacing any entry with the same id.
    void add(PackageSpec spec);

    /// Throws McpConfigError naming the valid ids when `id` is unknown.
    [[nodiscard]] const PackageSpec& resolve(const std::string& id) const;

    [[nodiscard]] bool contains(const std::string& id) const;
    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] std::size_t size() const { return packages_.size(); }

private:
    std::vector<PackageSpec> packages_;
};

} // namespace mcphub
