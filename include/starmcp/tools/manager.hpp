#pragma once
#include "starmcp/exceptions.hpp"
#include "starmcp/tools/tool.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace starmcp::tools
{

/// Ordered tool catalogue. Descriptors and handlers are stored together so the
/// names listed by tools/list are exactly the names tools/call can dispatch.
/// Enumeration order is registration order.
class ToolManager
{
  public:
    void register_tool(Tool t)
    {
        auto it = index_.find(t.name());
        if (it != index_.end())
            throw ValidationError("duplicate tool name: " + t.name());
        index_.emplace(t.name(), tools_.size());
        tools_.push_back(std::move(t));
    }

    bool has(const std::string& name) const
    {
        return index_.count(name) != 0;
    }

    const Tool& get(const std::string& name) const
    {
        auto it = index_.find(name);
        if (it == index_.end())
            throw NotFoundError("Unknown tool: " + name);
        return tools_[it->second];
    }

    Json invoke(const std::string& name, const Json& arguments) const
    {
        return get(name).invoke(arguments);
    }

    std::vector<ToolDescriptor> list() const
    {
        std::vector<ToolDescriptor> out;
        out.reserve(tools_.size());
        for (const auto& t : tools_)
            out.push_back(t.descriptor());
        return out;
    }

    std::vector<std::string> list_names() const
    {
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& t : tools_)
            names.push_back(t.name());
        return names;
    }

    size_t size() const
    {
        return tools_.size();
    }

  private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace starmcp::tools
