#include "mcphub/package_catalog.hpp"
#include "mcphub/error.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace mcphub {

namespace {

PackageSpec npx_package(const std::string& id, const std::string& package) {
    PackageSpec spec;
    spec.id = id;
    spec.display_name = package;
    spec.launch.command = "npx";
    spec.launch.args = {"-y", package};
    return spec;
}

} // anonymous namespace

void from_json(const nlohmann::json& j, PackageSpec& p) {
    p.id = j.at("id").get<std::string>();
    p.display_name = j.value("name", p.id);
    p.launch.command = j.at("command").get<std::string>();
    p.launch.args = j.value("args", std::vector<std::string>{});
    if (j.contains("cwd") && !j.at("cwd").is_null()) {
        p.launch.working_dir = j.at("cwd").get<std::string>();
    }
    if (j.contains("env")) {
        p.launch.env = j.at("env").get<std::map<std::string, std::string>>();
    }
}

PackageCatalog PackageCatalog::defaults() {
    PackageCatalog catalog;
    catalog.add(npx_package("monolithic", "@aidd.md/mcp"));
    catalog.add(npx_package("core", "@aidd.md/mcp-core"));
    catalog.add(npx_package("memory", "@aidd.md/mcp-memory"));
    catalog.add(npx_package("tools", "@aidd.md/mcp-tools"));
    return catalog;
}

PackageCatalog PackageCatalog::from_json(const nlohmann::json& config) {
    if (!config.is_object() || !config.contains("packages") || !config.at("packages").is_array()) {
        throw McpConfigError("Package config must be an object with a 'packages' array");
    }

    PackageCatalog catalog;
    for (const auto& entry : config.at("packages")) {
        try {
            catalog.add(entry.get<PackageSpec>());
        } catch (const nlohmann::json::exception& e) {
            throw McpConfigError(std::string("Invalid package entry ") + entry.dump() + ": " + e.what());
        }
    }
    return catalog;
}

PackageCatalog PackageCatalog::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw McpConfigError("Cannot open package config '" + path + "'");
    }

    nlohmann::json config;
    try {
        in >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw McpConfigError("Cannot parse package config '" + path + "': " + e.what());
    }

    PackageCatalog catalog = defaults();
    for (auto& spec : from_json(config).packages_) {
        catalog.add(std::move(spec));
    }
    return catalog;
}

void PackageCatalog::add(PackageSpec spec) {
    if (spec.id.empty()) {
        throw McpConfigError("Package id must not be empty");
    }
    if (spec.launch.command.empty()) {
        throw McpConfigError("Package '" + spec.id + "' has no command");
    }
    auto it = std::find_if(packages_.begin(), packages_.end(),
                           [&](const PackageSpec& p) { return p.id == spec.id; });
    if (it != packages_.end()) {
        *it = std::move(spec);
    } else {
        packages_.push_back(std::move(spec));
    }
}

const PackageSpec& PackageCatalog::resolve(const std::string& id) const {
    auto it = std::find_if(packages_.begin(), packages_.end(),
                           [&](const PackageSpec& p) { return p.id == id; });
    if (it != packages_.end()) return *it;

    std::ostringstream valid;
    for (std::size_t i = 0; i < packages_.size(); ++i) {
        if (i > 0) valid << ", ";
        valid << packages_[i].id;
    }
    throw McpConfigError("Unknown package '" + id + "'. Valid: " + valid.str());
}

bool PackageCatalog::contains(const std::string& id) const {
    return std::any_of(packages_.begin(), packages_.end(),
                       [&](const PackageSpec& p) { return p.id == id; });
}

std::vector<std::string> PackageCatalog::ids() const {
    std::vector<std::string> out;
    out.reserve(packages_.size());
    for (const auto& p : packages_) out.push_back(p.id);
    return out;
}

} // namespace mcphub
