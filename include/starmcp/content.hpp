#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace starmcp
{

using Json = nlohmann::json;

struct TextContent
{
    std::string type{"text"};
    std::string text;
};

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", std::string("text"));
    c.text = j.at("text").get<std::string>();
}

/// Single-item content list holding one text block.
inline Json text_content(const std::string& text)
{
    return Json::array({Json(TextContent{"text", text})});
}

} // namespace starmcp
