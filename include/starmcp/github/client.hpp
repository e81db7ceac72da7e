#pragma once
#include "starmcp/github/http_fetcher.hpp"
#include "starmcp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace starmcp::github
{

struct ClientOptions
{
    std::string api_url{"https://api.github.com"};
    std::optional<std::string> token;
    std::string user_agent{"starmcp/1.2.0"};
    int timeout_ms{30000};
    int max_per_page{100};
    /// Upper bound on repositories fetched by search and stats.
    int max_repos_for_analysis{1000};
};

/**
 * Thin wrapper over the GitHub REST v3 endpoints used by the star tools.
 *
 * Every operation returns a JSON object ready to hand back to a client. HTTP
 * failures raise GitHubError (401, 403, 404 and anything else unexpected), and
 * network failures raise TransportError.
 */
class Client
{
  public:
    explicit Client(ClientOptions options, HttpFetcher fetcher = make_curl_fetcher());

    bool has_token() const
    {
        return options_.token.has_value() && !options_.token->empty();
    }
    const ClientOptions& options() const
    {
        return options_;
    }

    Json get_user_starred_repos(const std::string& username, int page = 1, int per_page = 30,
                                const std::string& sort = "created") const;
    Json search_starred_repos(const std::string& username, const std::string& query,
                              const std::optional<std::string>& language = std::nullopt) const;
    Json get_repo_info(const std::string& owner, const std::string& repo) const;

    /// Token required.
    Json check_if_starred(const std::string& owner, const std::string& repo) const;
    /// Token required.
    Json star_repo(const std::string& owner, const std::string& repo) const;
    /// Token required.
    Json unstar_repo(const std::string& owner, const std::string& repo) const;

    Json get_starred_stats(const std::string& username) const;
    Json get_repo_languages(const std::string& owner, const std::string& repo) const;

  private:
    HttpResponse send(const std::string& method, const std::string& url) const;
    Json get_json(const std::string& url) const;
    std::vector<Json> fetch_all_starred(const std::string& username) const;
    void require_token() const;
    std::string repo_path(const std::string& prefix, const std::string& owner,
                          const std::string& repo) const;

    ClientOptions options_;
    HttpFetcher fetcher_;
};

} // namespace starmcp::github
