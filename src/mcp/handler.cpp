#include "starmcp/mcp/handler.hpp"

#include "starmcp/mcp/jsonrpc.hpp"
#include "starmcp/tools/outcome.hpp"
#include "starmcp/util/log.hpp"

#include <string>

namespace starmcp::mcp
{

namespace
{

Json handle_initialize(const Json& id, const Json& params, const ServerInfo& info,
                       server::Session& session)
{
    session.record_initialize(params.value("capabilities", Json::object()));
    return make_result(id, Json{
                               {"protocolVersion", PROTOCOL_VERSION},
                               {"capabilities", server_capabilities()},
                               {"serverInfo", info},
                           });
}

Json handle_tools_list(const Json& id, const tools::ToolManager& tools)
{
    Json tools_array = Json::array();
    for (const auto& descriptor : tools.list())
        tools_array.push_back(descriptor);
    return make_result(id, Json{{"tools", tools_array}});
}

Json handle_tools_call(const Json& id, const Json& params, const tools::ToolManager& tools)
{
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string())
        return make_error(id, InternalError, "Error calling tool: missing tool name");

    std::string name = params["name"].get<std::string>();
    Json args = params.value("arguments", Json::object());
    if (args.is_null())
        args = Json::object();

    auto outcome = tools::invoke_tool(tools, name, args);
    if (outcome.is_fault())
    {
        log::error("tool call failed: " + name + ": " + outcome.fault_message());
        return make_error(id, InternalError, "Error calling tool: " + outcome.fault_message());
    }
    return make_result(id, Json{{"content", outcome.items()}});
}

} // namespace

Json server_capabilities()
{
    return Json{{"tools", Json::object()}, {"logging", Json::object()}};
}

McpHandler make_mcp_handler(ServerInfo info, const tools::ToolManager& tools,
                            std::shared_ptr<server::Session> session)
{
    if (!session)
        session = std::make_shared<server::Session>();

    return [info = std::move(info), &tools,
            session = std::move(session)](const Json& message) -> std::optional<Json>
    {
        const Json id = request_id(message);
        const bool notification = is_notification(message);
        try
        {
            if (!message.is_object())
                return make_error(Json(), InternalError,
                                  "Internal error: request must be a JSON object");

            std::string method = message.value("method", "");
            Json params = message.value("params", Json::object());
            if (params.is_null())
                params = Json::object();

            log::info("handling MCP message: " + method);

            std::optional<Json> response;
            if (method == "initialize")
                response = handle_initialize(id, params, info, *session);
            else if (method == "initialized" || method == "notifications/initialized")
            {
                session->mark_initialized();
                if (notification)
                    return std::nullopt;
                response = make_result(id, Json::object());
            }
            else if (method == "tools/list")
                response = handle_tools_list(id, tools);
            else if (method == "tools/call")
                response = handle_tools_call(id, params, tools);
            else
                response = make_error(id, MethodNotFound, "Method not found: " + method);

            if (notification)
                return std::nullopt;
            return response;
        }
        catch (const std::exception& e)
        {
            log::error(std::string("error while handling message: ") + e.what());
            if (notification)
                return std::nullopt;
            return make_error(id, InternalError, std::string("Internal error: ") + e.what());
        }
    };
}

} // namespace starmcp::mcp
