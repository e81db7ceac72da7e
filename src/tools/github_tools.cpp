#include "starmcp/tools/github_tools.hpp"

#include "starmcp/content.hpp"
#include "starmcp/github/token.hpp"
#include "starmcp/util/json.hpp"
#include "starmcp/util/log.hpp"
#include "starmcp/version.hpp"

#include <initializer_list>
#include <memory>
#include <utility>

namespace starmcp::tools
{

namespace
{

const char* const TOKEN_HINT = "GitHub Personal Access Token (strongly recommended to avoid "
                               "API rate limits)";
const char* const TOKEN_REQUIRED = "GitHub Personal Access Token (required for this operation)";
const char* const RATE_LIMIT_NOTE =
    " Note: pass the token parameter if you run into API rate limit errors.";

Json string_prop(const std::string& description)
{
    return Json{{"type", "string"}, {"description", description}};
}

Json object_schema(Json properties, std::initializer_list<const char*> required)
{
    Json req = Json::array();
    for (const char* r : required)
        req.push_back(r);
    return Json{{"type", "object"}, {"properties", std::move(properties)}, {"required", req}};
}

Json owner_repo_schema(const char* token_description, bool token_required)
{
    Json props = {{"owner", string_prop("Repository owner")},
                  {"repo", string_prop("Repository name")},
                  {"token", string_prop(token_description)}};
    if (token_required)
        return object_schema(std::move(props), {"owner", "repo", "token"});
    return object_schema(std::move(props), {"owner", "repo"});
}

/// Non-empty string argument, or nullopt.
std::optional<std::string> string_arg(const Json& args, const char* key)
{
    if (!args.is_object())
        return std::nullopt;
    auto it = args.find(key);
    if (it == args.end() || !it->is_string())
        return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty())
        return std::nullopt;
    return value;
}

class GitHubToolset
{
  public:
    explicit GitHubToolset(GitHubToolsConfig config) : config_(std::move(config)) {}

    github::Client client_for(const Json& args) const
    {
        github::ClientOptions options = config_.client;
        options.token = string_arg(args, "token");
        if (!options.token && config_.token_provider)
            options.token = config_.token_provider();
        return github::Client(std::move(options), config_.fetcher);
    }

    int default_per_page() const
    {
        return config_.default_per_page;
    }

  private:
    GitHubToolsConfig config_;
};

/// Validation and collaborator failures become text content, never protocol errors.
Tool::Fn guarded(const std::string& tool_name, std::function<std::string(const Json&)> body)
{
    return [tool_name, body = std::move(body)](const Json& args) -> Json
    {
        try
        {
            return text_content(body(args));
        }
        catch (const std::exception& e)
        {
            log::error("tool " + tool_name + " failed: " + e.what());
            return text_content(std::string("Error: ") + e.what());
        }
    };
}

std::string missing(const char* what)
{
    return std::string("Error: missing required parameter ") + what;
}

std::string pretty(const Json& result)
{
    return util::json::dump_pretty(result);
}

} // namespace

GitHubToolsConfig github_tools_config(const Settings& settings)
{
    GitHubToolsConfig config;
    config.client.api_url = settings.github_api_url;
    config.client.timeout_ms = settings.github_timeout_ms;
    config.client.max_per_page = settings.max_per_page;
    config.client.max_repos_for_analysis = settings.max_repos_for_analysis;
    config.client.user_agent = std::string("starmcp/") + VERSION_STRING;
    config.default_per_page = settings.default_per_page;

    if (settings.github_token)
    {
        auto token = *settings.github_token;
        config.token_provider = [token]() -> std::optional<std::string> { return token; };
    }
    else
    {
        config.token_provider = []() { return github::resolve_token(); };
    }

    auto enabled_tools = settings.enabled_tools;
    config.enabled = [enabled_tools](const std::string& name)
    {
        auto it = enabled_tools.find(name);
        return it == enabled_tools.end() || it->second;
    };
    return config;
}

void register_github_tools(ToolManager& tools, GitHubToolsConfig config)
{
    auto enabled = config.enabled;
    auto toolset = std::make_shared<const GitHubToolset>(std::move(config));

    auto add = [&](const std::string& name, const std::string& description, Json schema,
                   std::function<std::string(const Json&)> body)
    {
        if (enabled && !enabled(name))
        {
            log::info("tool disabled by configuration: " + name);
            return;
        }
        tools.register_tool(Tool(name, description, std::move(schema), guarded(name, std::move(body))));
    };

    add("get_user_starred_repos",
        std::string("List the repositories a user has starred.") + RATE_LIMIT_NOTE,
        object_schema(
            Json{{"username", string_prop("GitHub username")},
                 {"page", Json{{"type", "integer"}, {"description", "Page number, default 1"}}},
                 {"per_page",
                  Json{{"type", "integer"},
                       {"description", "Results per page, default 30, max 100"}}},
                 {"sort", Json{{"type", "string"},
                               {"description", "Sort order: created or updated"},
                               {"enum", Json::array({"created", "updated"})}}},
                 {"token", string_prop(TOKEN_HINT)}},
            {"username"}),
        [toolset](const Json& args)
        {
            auto username = string_arg(args, "username");
            if (!username)
                return missing("'username'");
            int page = args.value("page", 1);
            int per_page = args.value("per_page", toolset->default_per_page());
            std::string sort = args.value("sort", std::string("created"));
            return pretty(
                toolset->client_for(args).get_user_starred_repos(*username, page, per_page, sort));
        });

    add("search_starred_repos",
        std::string("Search within the repositories a user has starred.") + RATE_LIMIT_NOTE,
        object_schema(Json{{"username", string_prop("GitHub username")},
                           {"query", string_prop("Search keyword")},
                           {"language", string_prop("Programming language filter (optional)")},
                           {"token", string_prop(TOKEN_HINT)}},
                      {"username", "query"}),
        [toolset](const Json& args)
        {
            auto username = string_arg(args, "username");
            auto query = string_arg(args, "query");
            if (!username || !query)
                return missing("'username' or 'query'");
            return pretty(toolset->client_for(args).search_starred_repos(
                *username, *query, string_arg(args, "language")));
        });

    add("get_repo_info",
        std::string("Get detailed information about a repository.") + RATE_LIMIT_NOTE,
        owner_repo_schema(TOKEN_HINT, false),
        [toolset](const Json& args)
        {
            auto owner = string_arg(args, "owner");
            auto repo = string_arg(args, "repo");
            if (!owner || !repo)
                return missing("'owner' or 'repo'");
            return pretty(toolset->client_for(args).get_repo_info(*owner, *repo));
        });

    add("check_if_starred",
        "Check whether the authenticated user has starred a repository. Requires a token.",
        owner_repo_schema(TOKEN_REQUIRED, true),
        [toolset](const Json& args)
        {
            auto owner = string_arg(args, "owner");
            auto repo = string_arg(args, "repo");
            if (!owner || !repo)
                return missing("'owner' or 'repo'");
            return pretty(toolset->client_for(args).check_if_starred(*owner, *repo));
        });

    add("star_repo", "Star a repository. Requires a token with write access.",
        owner_repo_schema(TOKEN_REQUIRED, true),
        [toolset](const Json& args)
        {
            auto owner = string_arg(args, "owner");
            auto repo = string_arg(args, "repo");
            if (!owner || !repo)
                return missing("'owner' or 'repo'");
            return pretty(toolset->client_for(args).star_repo(*owner, *repo));
        });

    add("unstar_repo", "Remove the star from a repository. Requires a token with write access.",
        owner_repo_schema(TOKEN_REQUIRED, true),
        [toolset](const Json& args)
        {
            auto owner = string_arg(args, "owner");
            auto repo = string_arg(args, "repo");
            if (!owner || !repo)
                return missing("'owner' or 'repo'");
            return pretty(toolset->client_for(args).unstar_repo(*owner, *repo));
        });

    add("get_starred_stats",
        std::string("Summarize a user's starred repositories by language, topic and license.") +
            RATE_LIMIT_NOTE,
        object_schema(Json{{"username", string_prop("GitHub username")},
                           {"token", string_prop(TOKEN_HINT)}},
                      {"username"}),
        [toolset](const Json& args)
        {
            auto username = string_arg(args, "username");
            if (!username)
                return missing("'username'");
            return pretty(toolset->client_for(args).get_starred_stats(*username));
        });

    add("get_repo_languages",
        std::string("Get the programming language breakdown of a repository.") + RATE_LIMIT_NOTE,
        owner_repo_schema(TOKEN_HINT, false),
        [toolset](const Json& args)
        {
            auto owner = string_arg(args, "owner");
            auto repo = string_arg(args, "repo");
            if (!owner || !repo)
                return missing("'owner' or 'repo'");
            return pretty(toolset->client_for(args).get_repo_languages(*owner, *repo));
        });
}

} // namespace starmcp::tools
