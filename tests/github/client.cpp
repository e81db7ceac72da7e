#include "starmcp/exceptions.hpp"
#include "starmcp/github/client.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace starmcp;
using github::HttpRequest;
using github::HttpResponse;

namespace
{
// Canned responses keyed by "METHOD url"; records every request.
struct FakeGitHub
{
    std::map<std::string, HttpResponse> routes;
    std::vector<HttpRequest> requests;

    github::HttpFetcher fetcher()
    {
        return [this](const HttpRequest& req)
        {
            requests.push_back(req);
            auto it = routes.find(req.method + " " + req.url);
            if (it == routes.end())
                return HttpResponse{404, R"({"message":"Not Found"})"};
            return it->second;
        };
    }

    bool has_header(size_t i, const std::string& header) const
    {
        for (const auto& h : requests.at(i).headers)
            if (h == header)
                return true;
        return false;
    }
};

Json repo(int id, const std::string& name, const Json& language, long long stars,
          const Json& topics = Json::array(), const Json& license = Json())
{
    return Json{{"id", id},
                {"name", name},
                {"full_name", "owner/" + name},
                {"description", "About " + name},
                {"language", language},
                {"stargazers_count", stars},
                {"forks_count", stars / 10},
                {"html_url", "https://github.com/owner/" + name},
                {"clone_url", "https://github.com/owner/" + name + ".git"},
                {"topics", topics},
                {"license", license.is_null() ? Json() : Json{{"name", license}}}};
}

github::ClientOptions options(std::optional<std::string> token = std::nullopt)
{
    github::ClientOptions o;
    o.api_url = "https://api.test/";
    o.token = std::move(token);
    return o;
}

template <typename E, typename F> bool throws(F f)
{
    try
    {
        f();
    }
    catch (const E&)
    {
        return true;
    }
    return false;
}
} // namespace

int main()
{
    std::cout << "test_starred_repos..." << std::endl;
    {
        FakeGitHub gh;
        Json page = Json::array({repo(1, "alpha", "C++", 100), repo(2, "beta", nullptr, 5)});
        gh.routes["GET https://api.test/users/octo/starred?page=2&per_page=100&sort=updated"] = {
            200, page.dump()};
        github::Client client(options("tok"), gh.fetcher());

        // per_page is clamped to 100
        auto out = client.get_user_starred_repos("octo", 2, 500, "updated");
        assert(out["username"] == "octo");
        assert(out["page"] == 2);
        assert(out["total_count"] == 2);
        assert(out["repositories"][0]["full_name"] == "owner/alpha");
        assert(out["repositories"][0]["stars"] == 100);
        assert(out["repositories"][1]["language"].is_null());

        assert(gh.requests.size() == 1);
        assert(gh.has_header(0, "Accept: application/vnd.github.v3+json"));
        assert(gh.has_header(0, "Authorization: token tok"));
        assert(gh.has_header(0, "User-Agent: starmcp/1.2.0"));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_status_mapping..." << std::endl;
    {
        FakeGitHub gh;
        gh.routes["GET https://api.test/repos/o/forbidden"] = {403, "{}"};
        gh.routes["GET https://api.test/repos/o/unauth"] = {401, "{}"};
        gh.routes["GET https://api.test/repos/o/broken"] = {500, "oops"};
        github::Client client(options(), gh.fetcher());

        try
        {
            client.get_repo_info("o", "missing");
            assert(false);
        }
        catch (const GitHubError& e)
        {
            assert(e.status() == 404);
            assert(std::string(e.what()).find("Resource not found") != std::string::npos);
        }
        try
        {
            client.get_repo_info("o", "forbidden");
            assert(false);
        }
        catch (const GitHubError& e)
        {
            assert(e.status() == 403);
            assert(std::string(e.what()).find("rate limit") != std::string::npos);
        }
        try
        {
            client.get_repo_info("o", "unauth");
            assert(false);
        }
        catch (const GitHubError& e)
        {
            assert(e.status() == 401);
        }
        try
        {
            client.get_repo_info("o", "broken");
            assert(false);
        }
        catch (const GitHubError& e)
        {
            assert(e.status() == 500);
            assert(std::string(e.what()).find("oops") != std::string::npos);
        }
        // No token header without a token
        assert(!gh.has_header(0, "Authorization: token "));
        for (const auto& h : gh.requests[0].headers)
            assert(h.rfind("Authorization", 0) != 0);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_repo_info..." << std::endl;
    {
        FakeGitHub gh;
        Json data = repo(7, "tool", "Rust", 42, Json::array({"cli"}), "MIT License");
        data["watchers_count"] = 42;
        data["open_issues_count"] = 3;
        data["default_branch"] = "main";
        data["owner"] = {{"login", "owner"}, {"type", "User"}, {"html_url", "https://github.com/owner"}};
        gh.routes["GET https://api.test/repos/owner/tool"] = {200, data.dump()};
        github::Client client(options(), gh.fetcher());

        auto info = client.get_repo_info("owner", "tool");
        assert(info["stars"] == 42);
        assert(info["open_issues"] == 3);
        assert(info["license"] == "MIT License");
        assert(info["default_branch"] == "main");
        assert(info["owner"]["login"] == "owner");
        assert(info["topics"][0] == "cli");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_token_required..." << std::endl;
    {
        FakeGitHub gh;
        github::Client client(options(), gh.fetcher());
        assert(throws<ValidationError>([&] { client.check_if_starred("o", "r"); }));
        assert(throws<ValidationError>([&] { client.star_repo("o", "r"); }));
        assert(throws<ValidationError>([&] { client.unstar_repo("o", "r"); }));
        assert(gh.requests.empty());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_star_operations..." << std::endl;
    {
        FakeGitHub gh;
        gh.routes["GET https://api.test/user/starred/o/yes"] = {204, ""};
        gh.routes["PUT https://api.test/user/starred/o/r"] = {204, ""};
        gh.routes["DELETE https://api.test/user/starred/o/r"] = {204, ""};
        gh.routes["PUT https://api.test/user/starred/o/locked"] = {403, "{}"};
        github::Client client(options("tok"), gh.fetcher());

        assert(client.check_if_starred("o", "yes")["starred"] == true);
        assert(client.check_if_starred("o", "no")["starred"] == false);

        auto starred = client.star_repo("o", "r");
        assert(starred["success"] == true);
        assert(starred["action"] == "starred");
        auto unstarred = client.unstar_repo("o", "r");
        assert(unstarred["action"] == "unstarred");

        assert(throws<GitHubError>([&] { client.star_repo("o", "locked"); }));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_search..." << std::endl;
    {
        FakeGitHub gh;
        Json page1 = Json::array({repo(1, "json-parser", "C++", 10),
                                  repo(2, "web", "JavaScript", 20, Json::array({"json"})),
                                  repo(3, "other", "C++", 30)});
        gh.routes["GET https://api.test/users/u/starred?page=1&per_page=100"] = {200, page1.dump()};
        gh.routes["GET https://api.test/users/u/starred?page=2&per_page=100"] = {200, "[]"};
        github::Client client(options(), gh.fetcher());

        auto all = client.search_starred_repos("u", "JSON");
        assert(all["total_starred"] == 3);
        assert(all["matched_count"] == 2);
        assert(all["language_filter"].is_null());

        auto cpp = client.search_starred_repos("u", "json", std::string("c++"));
        assert(cpp["matched_count"] == 1);
        assert(cpp["results"][0]["name"] == "json-parser");
        assert(cpp["language_filter"] == "c++");
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_stats..." << std::endl;
    {
        FakeGitHub gh;
        Json page1 = Json::array({
            repo(1, "a", "Go", 10, Json::array({"cli", "tools"}), "MIT License"),
            repo(2, "b", "C++", 20, Json::array({"tools"}), "MIT License"),
            repo(3, "c", "C++", 30, Json::array(), nullptr),
        });
        gh.routes["GET https://api.test/users/u/starred?page=1&per_page=100"] = {200, page1.dump()};
        gh.routes["GET https://api.test/users/u/starred?page=2&per_page=100"] = {200, "[]"};
        github::Client client(options(), gh.fetcher());

        auto stats = client.get_starred_stats("u");
        assert(stats["total_starred_repos"] == 3);
        assert(stats["total_stars_received"] == 60);
        assert(stats["avg_stars_per_repo"] == 20.0);
        assert(stats["language_distribution"][0]["language"] == "C++");
        assert(stats["language_distribution"][0]["count"] == 2);
        assert(stats["language_distribution"][1]["language"] == "Go");
        assert(stats["top_topics"][0]["topic"] == "tools");
        assert(stats["top_topics"][0]["count"] == 2);
        assert(stats["license_distribution"][0]["license"] == "MIT License");
        assert(stats["license_distribution"][1]["license"] == "No License");

        // No stars at all
        gh.routes["GET https://api.test/users/empty/starred?page=1&per_page=100"] = {200, "[]"};
        auto none = client.get_starred_stats("empty");
        assert(none["total_starred_repos"] == 0);
        assert(none["avg_stars_per_repo"] == 0.0);
        assert(none["language_distribution"].empty());
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_analysis_cap..." << std::endl;
    {
        FakeGitHub gh;
        Json page = Json::array();
        for (int i = 0; i < 100; ++i)
            page.push_back(repo(i, "r" + std::to_string(i), "C", 1));
        for (int p = 1; p <= 5; ++p)
            gh.routes["GET https://api.test/users/many/starred?page=" + std::to_string(p) +
                      "&per_page=100"] = {200, page.dump()};
        auto o = options();
        o.max_repos_for_analysis = 200;
        github::Client client(o, gh.fetcher());
        auto stats = client.get_starred_stats("many");
        assert(stats["total_starred_repos"] == 200);
        assert(gh.requests.size() == 2);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_languages..." << std::endl;
    {
        FakeGitHub gh;
        gh.routes["GET https://api.test/repos/o/r/languages"] = {200, R"({"C++": 750, "CMake": 250})"};
        github::Client client(options(), gh.fetcher());
        auto langs = client.get_repo_languages("o", "r");
        assert(langs["total_bytes"] == 1000);
        assert(langs["languages"]["C++"]["bytes"] == 750);
        assert(langs["languages"]["C++"]["percentage"] == 75.0);
        assert(langs["languages"]["CMake"]["percentage"] == 25.0);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_url_encode..." << std::endl;
    {
        assert(github::url_encode("a b/c") == "a%20b%2Fc");
        assert(github::url_encode("safe-._~") == "safe-._~");
    }
    std::cout << "  PASSED" << std::endl;

    return 0;
}
