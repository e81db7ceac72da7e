#pragma once
#include "starmcp/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace starmcp
{

struct Settings
{
    std::string log_level{"INFO"};

    // server
    std::string host{"localhost"};
    int port{38000};
    ServerInfo server_info{};
    std::chrono::seconds heartbeat_interval{30};
    /// Open event streams allowed at once; further GETs get 503.
    int max_sse_connections{100};
    std::string cors_origin{"*"};
    std::string toolset{"github"};

    // github
    std::optional<std::string> github_token;
    std::string github_api_url{"https://api.github.com"};
    int github_timeout_ms{30000};

    // tools
    int default_per_page{30};
    int max_per_page{100};
    int max_repos_for_analysis{1000};
    std::unordered_map<std::string, bool> enabled_tools;

    bool tool_enabled(const std::string& name) const
    {
        auto it = enabled_tools.find(name);
        return it == enabled_tools.end() || it->second;
    }

    static Settings from_env();
    static Settings from_env(Settings base);
    static Settings from_json(const Json& j);
    static Settings from_json(const Json& j, Settings base);
    static Settings from_file(const std::string& path);
};

} // namespace starmcp
