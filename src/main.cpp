#include "core/ServiceConfig.hpp"
#include "mcp/Errors.hpp"
#include "mcp/ServiceRegistry.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#ifndef MCPHUB_VERSION
#define MCPHUB_VERSION "0.0.0"
#endif

namespace {

bool configure_logging(const std::string& log_level) {
    // stdout carries command output; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("mcphub"));

    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return false;
    }
    return true;
}

void print_status_table(const nlohmann::json& status) {
    std::cout << std::left
              << std::setw(24) << "NAME"
              << std::setw(11) << "TRANSPORT"
              << std::setw(9) << "ENABLED"
              << std::setw(11) << "CONNECTED"
              << "ENDPOINT" << '\n';

    for (const auto& item : status.items()) {
        const auto& record = item.value();
        std::cout << std::setw(24) << item.key()
                  << std::setw(11) << record["transport"].get<std::string>()
                  << std::setw(9) << (record["enabled"].get<bool>() ? "yes" : "no")
                  << std::setw(11) << (record["connected"].get<bool>() ? "yes" : "no")
                  << record["endpoint"].get<std::string>() << '\n';

        const auto& info = record["server_info"];
        if (info.is_object()) {
            std::cout << "  server: " << info.value("name", "") << ' ' << info.value("version", "")
                      << " (protocol " << info.value("protocolVersion", "") << ")\n";
        }
    }
}

int run_connect(mcphub::ServiceRegistry& registry, const std::string& name) {
    if (!registry.connect_service(name)) {
        std::cout << "Failed to connect to " << name << ": " << registry.connect_error(name) << '\n';
        return 1;
    }

    std::cout << "Connected to " << name;
    auto client = registry.get_client(name);
    if (client) {
        if (auto info = client->server_info()) {
            std::cout << " (" << info->name << ' ' << info->version << ")";
        }
    }
    std::cout << '\n';
    return 0;
}

int run_tools(mcphub::ServiceRegistry& registry, const std::string& service) {
    if (service.empty()) {
        registry.auto_connect_enabled();
    } else if (!registry.connect_service(service)) {
        std::cout << "Failed to connect to " << service << ": " << registry.connect_error(service) << '\n';
        return 1;
    }

    auto all_tools = registry.list_all_tools();
    if (all_tools.empty()) {
        std::cout << "No connected services\n";
        return 0;
    }

    for (const auto& [name, tools] : all_tools) {
        if (!service.empty() && name != service) {
            continue;
        }
        std::cout << name << " (" << tools.size() << " tools)\n";
        for (const auto& tool : tools) {
            std::cout << "  " << tool.name;
            if (!tool.description.empty()) {
                std::cout << ": " << tool.description;
            }
            std::cout << '\n';
        }
    }
    return 0;
}

int run_call(mcphub::ServiceRegistry& registry,
             const std::string& service,
             const std::string& tool,
             const std::string& args_text) {
    nlohmann::json arguments;
    try {
        arguments = nlohmann::json::parse(args_text);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Invalid --args JSON: " << e.what() << std::endl;
        return 2;
    }
    if (!arguments.is_object()) {
        std::cerr << "--args must be a JSON object" << std::endl;
        return 2;
    }

    if (!registry.connect_service(service)) {
        std::cout << "Failed to connect to " << service << ": " << registry.connect_error(service) << '\n';
        return 1;
    }

    try {
        std::cout << registry.call_tool(service, tool, arguments).dump(2) << '\n';
        return 0;
    } catch (const mcphub::PeerError& e) {
        // Peer's error payload, unmodified
        std::cout << e.error().dump(2) << '\n';
        return 1;
    } catch (const mcphub::MCPError& e) {
        std::cerr << "Tool call on " << service << " failed: " << e.what() << std::endl;
        return 1;
    }
}

int run_resources(mcphub::ServiceRegistry& registry,
                  const std::string& service,
                  const std::string& uri) {
    if (!registry.connect_service(service)) {
        std::cout << "Failed to connect to " << service << ": " << registry.connect_error(service) << '\n';
        return 1;
    }

    try {
        if (!uri.empty()) {
            std::cout << registry.read_resource(service, uri).dump(2) << '\n';
            return 0;
        }
        for (const auto& resource : registry.list_resources(service)) {
            std::cout << resource.uri << "  " << resource.name;
            if (resource.mime_type) {
                std::cout << " [" << *resource.mime_type << "]";
            }
            std::cout << '\n';
        }
        return 0;
    } catch (const mcphub::PeerError& e) {
        std::cout << e.error().dump(2) << '\n';
        return 1;
    } catch (const mcphub::MCPError& e) {
        std::cerr << "Resource request on " << service << " failed: " << e.what() << std::endl;
        return 1;
    }
}

int run_set_enabled(mcphub::ServiceRegistry& registry, const std::string& name, bool enabled) {
    auto config = registry.get_service(name);
    if (!config) {
        std::cout << "Service not found: " << name << '\n';
        return 1;
    }
    config->enabled = enabled;
    registry.update_service(*config);
    std::cout << (enabled ? "Enabled " : "Disabled ") << name << '\n';
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"mcphub - registry and client for MCP services"};
    app.require_subcommand(0, 1);

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("warn");

    std::string config_dir;
    app.add_option("--config-dir", config_dir, "Directory holding service records");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    auto* list_cmd = app.add_subcommand("list", "List configured services");
    auto* status_cmd = app.add_subcommand("status", "Connect enabled services and show their status");

    mcphub::ServiceConfig added;
    std::string transport_name;
    std::vector<std::string> header_pairs;
    std::vector<std::string> process_args;
    bool disabled = false;
    auto* add_cmd = app.add_subcommand("add", "Add or replace a service");
    add_cmd->add_option("name", added.name, "Service name")->required();
    add_cmd->add_option("-t,--transport", transport_name, "stdio, http or websocket")
        ->required()
        ->check(CLI::IsMember({"stdio", "http", "websocket"}));
    add_cmd->add_option("-e,--endpoint", added.endpoint, "URL, or launch command for stdio")->required();
    add_cmd->add_option("-d,--description", added.description, "Description");
    add_cmd->add_option("--timeout", added.timeout_seconds, "Request timeout in seconds")->default_val(30);
    add_cmd->add_option("--retry", added.retry_count, "Connect attempts")->default_val(3);
    add_cmd->add_option("--arg", process_args, "Argument for the launched process (repeatable)");
    add_cmd->add_option("--header", header_pairs, "HTTP header as KEY=VALUE (repeatable)");
    add_cmd->add_flag("--disabled", disabled, "Add the service disabled");

    std::string target;
    auto* remove_cmd = app.add_subcommand("remove", "Remove a service and its record");
    remove_cmd->add_option("name", target, "Service name")->required();

    auto* enable_cmd = app.add_subcommand("enable", "Enable a service");
    enable_cmd->add_option("name", target, "Service name")->required();

    auto* disable_cmd = app.add_subcommand("disable", "Disable a service");
    disable_cmd->add_option("name", target, "Service name")->required();

    auto* connect_cmd = app.add_subcommand("connect", "Connect a service and report the outcome");
    connect_cmd->add_option("name", target, "Service name")->required();

    std::string tools_service;
    auto* tools_cmd = app.add_subcommand("tools", "List tools of connected services");
    tools_cmd->add_option("-s,--service", tools_service, "Only this service");

    std::string call_service;
    std::string call_tool;
    std::string call_args = "{}";
    auto* call_cmd = app.add_subcommand("call", "Call a tool");
    call_cmd->add_option("service", call_service, "Service name")->required();
    call_cmd->add_option("tool", call_tool, "Tool name")->required();
    call_cmd->add_option("-a,--args", call_args, "Tool arguments as a JSON object")->default_val("{}");

    std::string resources_service;
    std::string resource_uri;
    auto* resources_cmd = app.add_subcommand("resources", "List resources of a service, or read one");
    resources_cmd->add_option("service", resources_service, "Service name")->required();
    resources_cmd->add_option("-r,--read", resource_uri, "Resource URI to read");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcphub version " << MCPHUB_VERSION << std::endl;
        return 0;
    }

    if (app.get_subcommands().empty()) {
        std::cout << app.help();
        return 0;
    }

    if (!configure_logging(log_level)) {
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try {
        mcphub::RegistryOptions options;
        if (!config_dir.empty()) {
            options.config_dir = config_dir;
        }
        mcphub::ServiceRegistry registry(std::move(options));
        registry.load_services();

        if (*list_cmd) {
            print_status_table(registry.get_status());
            return 0;
        }
        if (*status_cmd) {
            registry.auto_connect_enabled();
            print_status_table(registry.get_status());
            return 0;
        }
        if (*add_cmd) {
            added.transport = mcphub::transport_from_string(transport_name);
            added.enabled = !disabled;
            if (!process_args.empty()) {
                added.args = process_args;
            }
            if (!header_pairs.empty()) {
                std::map<std::string, std::string> headers;
                for (const auto& pair : header_pairs) {
                    auto eq = pair.find('=');
                    if (eq == std::string::npos || eq == 0) {
                        std::cerr << "Invalid header (expected KEY=VALUE): " << pair << std::endl;
                        return 2;
                    }
                    headers[pair.substr(0, eq)] = pair.substr(eq + 1);
                }
                added.headers = headers;
            }
            registry.add_service(added);
            std::cout << "Added service " << added.name << '\n';
            return 0;
        }
        if (*remove_cmd) {
            if (!registry.remove_service(target)) {
                std::cout << "Service not found: " << target << '\n';
                return 1;
            }
            std::cout << "Removed service " << target << '\n';
            return 0;
        }
        if (*enable_cmd) {
            return run_set_enabled(registry, target, true);
        }
        if (*disable_cmd) {
            return run_set_enabled(registry, target, false);
        }
        if (*connect_cmd) {
            return run_connect(registry, target);
        }
        if (*tools_cmd) {
            return run_tools(registry, tools_service);
        }
        if (*call_cmd) {
            return run_call(registry, call_service, call_tool, call_args);
        }
        if (*resources_cmd) {
            return run_resources(registry, resources_service, resource_uri);
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
