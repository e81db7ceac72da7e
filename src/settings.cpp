#include "starmcp/settings.hpp"

#include "starmcp/exceptions.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace starmcp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static int to_int(const std::string& key, const std::string& value)
{
    try
    {
        size_t pos = 0;
        int v = std::stoi(value, &pos, 10);
        if (pos == value.size())
            return v;
    }
    catch (const std::exception&)
    {
    }
    throw ConfigError("invalid integer for " + key + ": '" + value + "'");
}

static std::chrono::seconds to_heartbeat(const std::string& key, int seconds)
{
    if (seconds <= 0)
        throw ConfigError(key + " must be a positive number of seconds, got " +
                          std::to_string(seconds));
    return std::chrono::seconds(seconds);
}

Settings Settings::from_env()
{
    return from_env(Settings{});
}

Settings Settings::from_env(Settings s)
{
    auto lvl = getenv_str("STARMCP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.host = getenv_str("STARMCP_HOST", s.host);
    s.toolset = getenv_str("STARMCP_TOOLSET", s.toolset);
    if (const char* port = std::getenv("STARMCP_PORT"))
        s.port = to_int("STARMCP_PORT", port);
    if (const char* hb = std::getenv("STARMCP_HEARTBEAT_SECONDS"))
        s.heartbeat_interval =
            to_heartbeat("STARMCP_HEARTBEAT_SECONDS", to_int("STARMCP_HEARTBEAT_SECONDS", hb));
    // GITHUB_TOKEN is not read here: github::resolve_token() ranks the token files above it.
    return s;
}

Settings Settings::from_json(const Json& j)
{
    return from_json(j, Settings{});
}

Settings Settings::from_json(const Json& j, Settings s)
{
    if (!j.is_object())
        throw ConfigError("configuration root must be an object");

    try
    {
        if (j.contains("server"))
        {
            const auto& srv = j.at("server");
            s.server_info.name = srv.value("name", s.server_info.name);
            s.server_info.version = srv.value("version", s.server_info.version);
            s.host = srv.value("host", s.host);
            s.port = srv.value("port", s.port);
        }
        if (j.contains("logging"))
            s.log_level = j.at("logging").value("level", s.log_level);
        if (j.contains("sse"))
        {
            const auto& sse = j.at("sse");
            s.heartbeat_interval = to_heartbeat(
                "sse.heartbeat_interval",
                sse.value("heartbeat_interval", static_cast<int>(s.heartbeat_interval.count())));
            s.max_sse_connections = sse.value("max_connections", s.max_sse_connections);
            if (s.max_sse_connections <= 0)
                throw ConfigError("sse.max_connections must be positive");
        }
        if (j.contains("cors"))
        {
            const auto& cors = j.at("cors");
            if (cors.contains("allowed_origins") && cors["allowed_origins"].is_array() &&
                !cors["allowed_origins"].empty())
                s.cors_origin = cors["allowed_origins"][0].get<std::string>();
        }
        if (j.contains("github"))
        {
            const auto& gh = j.at("github");
            if (gh.contains("token") && gh["token"].is_string() &&
                !gh["token"].get<std::string>().empty())
                s.github_token = gh["token"].get<std::string>();
            if (gh.contains("timeout"))
                s.github_timeout_ms = gh["timeout"].get<int>() * 1000;
            s.github_api_url = gh.value("api_url", s.github_api_url);
        }
        if (j.contains("tools"))
        {
            const auto& tools = j.at("tools");
            s.default_per_page = tools.value("default_per_page", s.default_per_page);
            s.max_per_page = tools.value("max_per_page", s.max_per_page);
            s.max_repos_for_analysis =
                tools.value("max_repos_for_analysis", s.max_repos_for_analysis);
            s.toolset = tools.value("toolset", s.toolset);
            if (tools.contains("enabled_tools") && tools["enabled_tools"].is_object())
                for (const auto& [name, enabled] : tools["enabled_tools"].items())
                    s.enabled_tools[name] = enabled.get<bool>();
        }
    }
    catch (const Json::exception& e)
    {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open config file: " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    Json j;
    try
    {
        j = Json::parse(buf.str());
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError("cannot parse config file " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace starmcp
