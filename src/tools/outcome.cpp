#include "starmcp/tools/outcome.hpp"

#include "starmcp/content.hpp"

namespace starmcp::tools
{

Json normalize_content(const Json& result)
{
    if (result.is_array())
    {
        Json content = Json::array();
        for (const auto& item : result)
        {
            if (item.is_object() && item.contains("text"))
                content.push_back(Json{{"type", item.value("type", std::string("text"))},
                                       {"text", item["text"]}});
            else if (item.is_string())
                content.push_back(Json(TextContent{"text", item.get<std::string>()}));
            else
                content.push_back(Json(TextContent{"text", item.dump()}));
        }
        return content;
    }
    if (result.is_string())
        return text_content(result.get<std::string>());
    if (result.is_object() && result.contains("text"))
        return normalize_content(Json::array({result}));
    return text_content(result.dump());
}

ToolOutcome invoke_tool(const ToolManager& tools, const std::string& name,
                        const Json& arguments) noexcept
{
    try
    {
        if (!tools.has(name))
            return ToolOutcome::fault("Unknown tool: " + name);
        return ToolOutcome::content(normalize_content(tools.invoke(name, arguments)));
    }
    catch (const std::exception& e)
    {
        return ToolOutcome::fault(e.what());
    }
    catch (...)
    {
        return ToolOutcome::fault("unknown error in tool '" + name + "'");
    }
}

} // namespace starmcp::tools
