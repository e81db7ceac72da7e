#pragma once
#include "starmcp/types.hpp"

#include <string>

namespace starmcp::server::sse
{

/// "event: <name>\ndata: <data>\n\n"
inline std::string format_event(const std::string& event, const std::string& data)
{
    return "event: " + event + "\ndata: " + data + "\n\n";
}

/// Unnamed event, "data: <data>\n\n".
inline std::string format_data(const std::string& data)
{
    return "data: " + data + "\n\n";
}

inline std::string connected_frame()
{
    return format_event("connected", R"({"type":"connected"})");
}

inline std::string ping_frame()
{
    return format_event("ping", R"({"type":"ping"})");
}

} // namespace starmcp::server::sse
