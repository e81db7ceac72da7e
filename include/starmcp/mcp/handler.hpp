#pragma once
#include "starmcp/server/session.hpp"
#include "starmcp/tools/manager.hpp"
#include "starmcp/types.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace starmcp::mcp
{

/// Handles one decoded JSON-RPC message. An empty optional means "send no body".
using McpHandler = std::function<std::optional<Json>(const Json&)>;

/// Server capabilities advertised in the initialize result.
Json server_capabilities();

// Factory for the request dispatcher. Routes, in order:
// - "initialize"   records client capabilities, returns protocol version and server identity
// - "initialized"  moves the session to Initialized, no response
// - "tools/list"   descriptors in registry order
// - "tools/call"   runs params.name with params.arguments
// Anything else is MethodNotFound. No exception escapes the returned handler.
//
// The ToolManager is captured by reference and must outlive the handler.
McpHandler make_mcp_handler(ServerInfo info, const tools::ToolManager& tools,
                            std::shared_ptr<server::Session> session);

} // namespace starmcp::mcp
