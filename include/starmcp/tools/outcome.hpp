#pragma once
#include "starmcp/tools/manager.hpp"
#include "starmcp/types.hpp"

#include <string>
#include <variant>

namespace starmcp::tools
{

/// Result of routing a tools/call to a handler.
///
/// Content covers both successful tool output and handler-level failures, which
/// handlers report as text inside their content list. Fault means the call could
/// not be routed or the handler threw; the dispatcher turns it into a JSON-RPC error.
class ToolOutcome
{
  public:
    struct Content
    {
        Json items;
    };
    struct Fault
    {
        std::string message;
    };

    static ToolOutcome content(Json items)
    {
        return ToolOutcome(Content{std::move(items)});
    }
    static ToolOutcome fault(std::string message)
    {
        return ToolOutcome(Fault{std::move(message)});
    }

    bool is_content() const
    {
        return std::holds_alternative<Content>(value_);
    }
    bool is_fault() const
    {
        return std::holds_alternative<Fault>(value_);
    }
    const Json& items() const
    {
        return std::get<Content>(value_).items;
    }
    const std::string& fault_message() const
    {
        return std::get<Fault>(value_).message;
    }

  private:
    explicit ToolOutcome(std::variant<Content, Fault> v) : value_(std::move(v)) {}

    std::variant<Content, Fault> value_;
};

/// Look up `name` and run its handler, capturing lookup failures and escaped
/// exceptions as a Fault. Never throws.
ToolOutcome invoke_tool(const ToolManager& tools, const std::string& name,
                        const Json& arguments) noexcept;

/// Normalizes whatever a handler returned into a content list of {type,text} items.
Json normalize_content(const Json& result);

} // namespace starmcp::tools
