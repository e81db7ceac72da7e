#include "starmcp/exceptions.hpp"
#include "starmcp/mcp/handler.hpp"
#include "starmcp/server/session.hpp"
#include "starmcp/server/sse_server.hpp"
#include "starmcp/settings.hpp"
#include "starmcp/tools/github_tools.hpp"
#include "starmcp/tools/manager.hpp"
#include "starmcp/tools/star_tools.hpp"
#include "starmcp/util/log.hpp"
#include "starmcp/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{

static std::atomic<bool> g_running{true};

static void signal_handler(int)
{
    g_running = false;
}

static int usage(int exit_code = 1)
{
    std::cout << "starmcp " << starmcp::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  starmcp [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --host <host>          Address to bind (default: localhost)\n";
    std::cout << "  -p, --port <port>      Port to listen on (default: 38000)\n";
    std::cout << "  --config <file>        JSON configuration file\n";
    std::cout << "  --toolset <name>       github | stars (default: github)\n";
    std::cout << "  --heartbeat <seconds>  Delay between SSE ping events (default: 30)\n";
    std::cout << "  -d, --debug            Enable debug logging\n";
    std::cout << "  -v, --version          Print version and exit\n";
    std::cout << "  -h, --help             Show this help\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  STARMCP_HOST, STARMCP_PORT, STARMCP_LOG_LEVEL, STARMCP_TOOLSET,\n";
    std::cout << "  STARMCP_HEARTBEAT_SECONDS, GITHUB_TOKEN\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag,
                                                     const std::string& alias)
{
    if (auto v = consume_flag_value(args, flag))
        return v;
    return consume_flag_value(args, alias);
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<int> parse_int(const std::string& s)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(s, &pos, 10);
        if (pos != s.size())
            return std::nullopt;
        return v;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version") || consume_flag(args, "-v"))
    {
        std::cout << "starmcp " << starmcp::VERSION_STRING << "\n";
        return 0;
    }

    bool debug = consume_flag(args, "--debug");
    debug = consume_flag(args, "-d") || debug;
    auto host_flag = consume_flag_value(args, "--host");
    auto port_flag = consume_flag_value(args, "--port", "-p");
    auto config_flag = consume_flag_value(args, "--config");
    auto toolset_flag = consume_flag_value(args, "--toolset");
    auto heartbeat_flag = consume_flag_value(args, "--heartbeat");

    if (!args.empty())
    {
        std::cerr << "Unknown argument: " << args.front() << "\n";
        return usage();
    }

    starmcp::Settings settings;
    try
    {
        if (config_flag)
            settings = starmcp::Settings::from_file(*config_flag);
        settings = starmcp::Settings::from_env(settings);
    }
    catch (const starmcp::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (host_flag)
        settings.host = *host_flag;
    if (port_flag)
    {
        auto port = parse_int(*port_flag);
        if (!port || *port <= 0 || *port > 65535)
        {
            std::cerr << "Invalid port: " << *port_flag << "\n";
            return 1;
        }
        settings.port = *port;
    }
    if (heartbeat_flag)
    {
        auto seconds = parse_int(*heartbeat_flag);
        if (!seconds || *seconds <= 0)
        {
            std::cerr << "Invalid heartbeat interval: " << *heartbeat_flag << "\n";
            return 1;
        }
        settings.heartbeat_interval = std::chrono::seconds(*seconds);
    }
    if (toolset_flag)
        settings.toolset = *toolset_flag;
    if (debug)
        settings.log_level = "DEBUG";

    starmcp::log::set_level(starmcp::log::level_from_string(settings.log_level));

    starmcp::tools::ToolManager tools;
    if (settings.toolset == "github")
    {
        starmcp::tools::register_github_tools(tools,
                                              starmcp::tools::github_tools_config(settings));
    }
    else if (settings.toolset == "stars")
    {
        starmcp::tools::register_star_tools(tools);
    }
    else
    {
        std::cerr << "Unknown toolset: " << settings.toolset << " (expected github or stars)\n";
        return 1;
    }

    auto session = std::make_shared<starmcp::server::Session>();
    auto handler = starmcp::mcp::make_mcp_handler(settings.server_info, tools, session);

    starmcp::server::SseServer server(
        handler, settings.server_info, settings.host, settings.port, "/sse",
        std::chrono::duration_cast<std::chrono::milliseconds>(settings.heartbeat_interval),
        settings.cors_origin, static_cast<size_t>(settings.max_sse_connections));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!server.start())
    {
        starmcp::log::error("Failed to start server on " + settings.host + ":" +
                            std::to_string(settings.port));
        return 1;
    }

    starmcp::log::info("Serving " + std::to_string(tools.size()) + " tools (" + settings.toolset +
                       ") at http://" + settings.host + ":" + std::to_string(settings.port) +
                       "/sse");
    std::cout << "Server started. Press Ctrl+C to stop.\n";

    while (g_running)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    server.stop();
    starmcp::log::info("Server stopped");
    return 0;
}
