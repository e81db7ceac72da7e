#pragma once
#include "starmcp/github/client.hpp"
#include "starmcp/github/http_fetcher.hpp"
#include "starmcp/settings.hpp"
#include "starmcp/tools/manager.hpp"

#include <functional>
#include <optional>
#include <string>

namespace starmcp::tools
{

struct GitHubToolsConfig
{
    /// Base client options; the token field is ignored in favour of token_provider.
    github::ClientOptions client;
    /// Empty = libcurl.
    github::HttpFetcher fetcher;
    /// Token used when a call does not pass one. Empty = no default token.
    std::function<std::optional<std::string>()> token_provider;
    int default_per_page{30};
    /// Empty = every tool enabled.
    std::function<bool(const std::string&)> enabled;
};

/// Builds the configuration from settings. A token in settings wins over
/// github::resolve_token(), which is consulted on every call otherwise.
GitHubToolsConfig github_tools_config(const Settings& settings);

/// Registers get_user_starred_repos, search_starred_repos, get_repo_info,
/// check_if_starred, star_repo, unstar_repo, get_starred_stats and
/// get_repo_languages, in that order, skipping disabled ones.
void register_github_tools(ToolManager& tools, GitHubToolsConfig config);

} // namespace starmcp::tools
