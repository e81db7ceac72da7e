#pragma once
#include "starmcp/types.hpp"

#include <functional>
#include <string>

namespace starmcp::tools
{

/// Name, description and JSON-Schema input contract of a tool, as listed by tools/list.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    Json input_schema = Json::object();
};

inline void to_json(Json& j, const ToolDescriptor& d)
{
    j = Json{{"name", d.name}, {"description", d.description}, {"inputSchema", d.input_schema}};
}

inline void from_json(const Json& j, ToolDescriptor& d)
{
    d.name = j.at("name").get<std::string>();
    d.description = j.value("description", std::string());
    d.input_schema = j.value("inputSchema", Json::object());
}

class Tool
{
  public:
    /// Receives the call arguments, returns a content list ([{"type":"text","text":...}, ...]).
    using Fn = std::function<Json(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, Json input_schema, Fn fn)
        : descriptor_{std::move(name), std::move(description), std::move(input_schema)},
          fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return descriptor_.name;
    }
    const std::string& description() const
    {
        return descriptor_.description;
    }
    const Json& input_schema() const
    {
        return descriptor_.input_schema;
    }
    const ToolDescriptor& descriptor() const
    {
        return descriptor_;
    }
    Json invoke(const Json& arguments) const
    {
        return fn_(arguments);
    }

  private:
    ToolDescriptor descriptor_;
    Fn fn_;
};

} // namespace starmcp::tools
