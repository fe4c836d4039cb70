/// Hub CLI: start a package under the supervisor, talk to it, stop it.
/// Usage: ./mcphub_cli [--config catalog.json] [--timeout ms] [--log-level level]
///                     <package> [<tool> [<json-arguments>]]
/// Example: ./mcphub_cli core
///          ./mcphub_cli --config peers.json echo echo '{"text":"hi"}'

#include <mcphub/mcphub.hpp>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config <catalog.json>] [--timeout <ms>] [--log-level <level>]"
                 " <package> [<tool> [<json-arguments>]]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    mcphub::log::init_from_env();

    std::string config_path;
    std::chrono::milliseconds timeout{30000};
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "--config" || arg == "--timeout" || arg == "--log-level") && i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            if (arg == "--config") {
                config_path = argv[++i];
            } else if (arg == "--timeout") {
                timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
            } else if (arg == "--log-level") {
                mcphub::log::set_level(mcphub::log::level_from_string(argv[++i]));
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else {
                positional.push_back(std::move(arg));
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    if (positional.empty() || positional.size() > 3) {
        usage(argv[0]);
        return 2;
    }

    try {
        mcphub::Supervisor::Options opts;
        if (!config_path.empty()) {
            opts.catalog = mcphub::PackageCatalog::load_file(config_path);
        }
        opts.request_timeout = timeout;
        mcphub::Supervisor supervisor{std::move(opts)};

        const std::string& package = positional[0];
        auto started = supervisor.start(package, mcphub::HostingMode::HubHosted);
        std::cerr << "Started " << started.name << " (pid " << *started.pid << ")\n";

        auto init = supervisor.initialize(package);
        std::cerr << "Initialized: " << init.dump() << "\n";

        nlohmann::json output;
        if (positional.size() == 1) {
            output = supervisor.list_tools(package);
        } else {
            nlohmann::json arguments = nlohmann::json::object();
            if (positional.size() == 3) {
                arguments = nlohmann::json::parse(positional[2]);
            }
            output = supervisor.call_tool(package, positional[1], arguments);
        }
        std::cout << output.dump(2) << "\n";

        auto servers = supervisor.get_servers();
        nlohmann::json status = {
            {"servers", servers},
            {"summary", mcphub::summarize(servers)}
        };
        std::cerr << status.dump(2) << "\n";

        supervisor.stop_all();
    } catch (const mcphub::McpError& e) {
        std::cerr << "mcphub error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
