#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace starmcp
{

using Json = nlohmann::json;

/// Identity reported in the MCP initialize response and by /health.
struct ServerInfo
{
    std::string name{"github_star_classifier"};
    std::string version{"1.0.0"};
};

inline void to_json(Json& j, const ServerInfo& info)
{
    j = Json{{"name", info.name}, {"version", info.version}};
}

inline void from_json(const Json& j, ServerInfo& info)
{
    info.name = j.at("name").get<std::string>();
    if (j.contains("version"))
        info.version = j["version"].get<std::string>();
}

} // namespace starmcp
