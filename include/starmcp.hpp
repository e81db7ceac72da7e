#pragma once

/// @file starmcp.hpp
/// @brief Main header for starmcp - includes the server, dispatcher and tool components
///
/// Usage:
/// @code
/// #include <starmcp.hpp>
///
/// int main() {
///     starmcp::tools::ToolManager tools;
///     starmcp::tools::register_star_tools(tools);
///
///     auto session = std::make_shared<starmcp::server::Session>();
///     starmcp::ServerInfo info;
///     auto handler = starmcp::mcp::make_mcp_handler(info, tools, session);
///
///     starmcp::server::SseServer server(handler, info, "127.0.0.1", 38000);
///     server.start();
/// }
/// @endcode

// Core types and exceptions
#include "starmcp/content.hpp"
#include "starmcp/exceptions.hpp"
#include "starmcp/settings.hpp"
#include "starmcp/types.hpp"
#include "starmcp/version.hpp"

// Tools
#include "starmcp/tools/github_tools.hpp"
#include "starmcp/tools/manager.hpp"
#include "starmcp/tools/outcome.hpp"
#include "starmcp/tools/star_tools.hpp"
#include "starmcp/tools/tool.hpp"

// MCP
#include "starmcp/mcp/handler.hpp"
#include "starmcp/mcp/jsonrpc.hpp"

// Server
#include "starmcp/server/broadcast_hub.hpp"
#include "starmcp/server/session.hpp"
#include "starmcp/server/sse_server.hpp"

// GitHub
#include "starmcp/github/client.hpp"
#include "starmcp/github/token.hpp"

// Utilities
#include "starmcp/util/json.hpp"
#include "starmcp/util/log.hpp"
