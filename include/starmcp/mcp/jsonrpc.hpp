#pragma once
#include "starmcp/types.hpp"

#include <string>

namespace starmcp::mcp
{

constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

/// The only JSON-RPC error codes this server emits.
enum ErrorCode : int
{
    ParseError = -32700,
    MethodNotFound = -32601,
    InternalError = -32603,
};

inline Json make_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"result", std::move(result)}};
}

inline Json make_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", JSONRPC_VERSION},
                {"id", id.is_null() ? Json() : id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

/// A message without an "id" member expects no response.
inline bool is_notification(const Json& message)
{
    return message.is_object() && !message.contains("id");
}

/// The request id, or null when the message carries none.
inline Json request_id(const Json& message)
{
    if (message.is_object() && message.contains("id"))
        return message["id"];
    return Json();
}

} // namespace starmcp::mcp
