#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace starmcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    // Non-ASCII text (repository descriptions, star names) is kept as-is.
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace starmcp::util::json
