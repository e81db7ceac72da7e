#include "starmcp/github/client.hpp"

#include "starmcp/exceptions.hpp"
#include "starmcp/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>
#include <utility>

namespace starmcp::github
{

namespace
{

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim_trailing_slash(std::string s)
{
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    return s;
}

double round2(double v)
{
    return std::round(v * 100.0) / 100.0;
}

Json string_or_null(const Json& repo, const char* key)
{
    auto it = repo.find(key);
    if (it == repo.end())
        return Json();
    return *it;
}

Json license_name(const Json& repo)
{
    auto it = repo.find("license");
    if (it == repo.end() || !it->is_object())
        return Json();
    return it->value("name", Json());
}

Json topics_of(const Json& repo)
{
    auto it = repo.find("topics");
    if (it == repo.end() || !it->is_array())
        return Json::array();
    return *it;
}

Json simplify_starred(const Json& repo)
{
    return Json{
        {"id", repo.at("id")},
        {"name", repo.at("name")},
        {"full_name", repo.at("full_name")},
        {"description", string_or_null(repo, "description")},
        {"language", string_or_null(repo, "language")},
        {"stars", repo.value("stargazers_count", 0)},
        {"forks", repo.value("forks_count", 0)},
        {"url", string_or_null(repo, "html_url")},
        {"clone_url", string_or_null(repo, "clone_url")},
        {"created_at", string_or_null(repo, "created_at")},
        {"updated_at", string_or_null(repo, "updated_at")},
        {"topics", topics_of(repo)},
        {"license", license_name(repo)},
        {"archived", repo.value("archived", false)},
        {"fork", repo.value("fork", false)},
    };
}

// Insertion-ordered counter; ties keep first-seen order after sorting.
class Tally
{
  public:
    void add(const std::string& key, long long amount = 1)
    {
        auto it = index_.find(key);
        if (it == index_.end())
        {
            index_.emplace(key, entries_.size());
            entries_.emplace_back(key, amount);
        }
        else
        {
            entries_[it->second].second += amount;
        }
    }

    Json to_json(const char* key_name, size_t limit = 0) const
    {
        auto sorted = entries_;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (limit > 0 && sorted.size() > limit)
            sorted.resize(limit);

        Json out = Json::array();
        for (const auto& [key, count] : sorted)
            out.push_back(Json{{key_name, key}, {"count", count}});
        return out;
    }

  private:
    std::vector<std::pair<std::string, long long>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace

Client::Client(ClientOptions options, HttpFetcher fetcher)
    : options_(std::move(options)), fetcher_(std::move(fetcher))
{
    options_.api_url = trim_trailing_slash(options_.api_url);
    if (!fetcher_)
        fetcher_ = make_curl_fetcher();
}

HttpResponse Client::send(const std::string& method, const std::string& url) const
{
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeout_ms = options_.timeout_ms;
    request.headers.push_back("Accept: application/vnd.github.v3+json");
    request.headers.push_back("User-Agent: " + options_.user_agent);
    if (has_token())
        request.headers.push_back("Authorization: token " + *options_.token);

    log::debug("GitHub " + method + " " + url);
    return fetcher_(request);
}

Json Client::get_json(const std::string& url) const
{
    auto response = send("GET", url);
    switch (response.status_code)
    {
    case 200:
        try
        {
            return Json::parse(response.body);
        }
        catch (const Json::parse_error& e)
        {
            throw GitHubError(200, std::string("Malformed API response: ") + e.what());
        }
    case 404:
        throw GitHubError(404, "Resource not found: " + url);
    case 403:
        throw GitHubError(403, "API rate limit exceeded or insufficient permissions, check the token");
    case 401:
        throw GitHubError(401, "Authentication failed, check the token");
    default:
        throw GitHubError(response.status_code,
                          "API request failed (status " + std::to_string(response.status_code) +
                              "): " + response.body);
    }
}

void Client::require_token() const
{
    if (!has_token())
        throw ValidationError("This operation requires a GitHub token");
}

std::string Client::repo_path(const std::string& prefix, const std::string& owner,
                              const std::string& repo) const
{
    return options_.api_url + prefix + url_encode(owner) + "/" + url_encode(repo);
}

Json Client::get_user_starred_repos(const std::string& username, int page, int per_page,
                                    const std::string& sort) const
{
    int effective = std::min(per_page, options_.max_per_page);
    std::string url = options_.api_url + "/users/" + url_encode(username) +
                      "/starred?page=" + std::to_string(page) +
                      "&per_page=" + std::to_string(effective) + "&sort=" + url_encode(sort);

    auto repos = get_json(url);
    Json simplified = Json::array();
    if (repos.is_array())
        for (const auto& repo : repos)
            simplified.push_back(simplify_starred(repo));

    return Json{{"username", username},
                {"page", page},
                {"per_page", per_page},
                {"total_count", simplified.size()},
                {"repositories", simplified}};
}

std::vector<Json> Client::fetch_all_starred(const std::string& username) const
{
    std::vector<Json> all;
    const size_t cap = static_cast<size_t>(std::max(0, options_.max_repos_for_analysis));
    for (int page = 1;; ++page)
    {
        std::string url = options_.api_url + "/users/" + url_encode(username) +
                          "/starred?page=" + std::to_string(page) + "&per_page=100";
        auto repos = get_json(url);
        if (!repos.is_array() || repos.empty())
            break;
        for (auto& repo : repos)
            all.push_back(std::move(repo));
        if (all.size() >= cap)
            break;
    }
    return all;
}

Json Client::search_starred_repos(const std::string& username, const std::string& query,
                                  const std::optional<std::string>& language) const
{
    auto all = fetch_all_starred(username);
    const std::string needle = lower(query);
    const std::optional<std::string> lang_filter =
        (language && !language->empty()) ? std::optional<std::string>(lower(*language))
                                         : std::nullopt;

    Json results = Json::array();
    for (const auto& repo : all)
    {
        Json repo_lang = string_or_null(repo, "language");
        if (lang_filter && repo_lang.is_string() &&
            lower(repo_lang.get<std::string>()) != *lang_filter)
            continue;

        std::string topics;
        for (const auto& t : topics_of(repo))
            if (t.is_string())
                topics += (topics.empty() ? "" : " ") + t.get<std::string>();

        Json desc = string_or_null(repo, "description");
        const std::string fields[] = {
            lower(repo.value("name", std::string())),
            desc.is_string() ? lower(desc.get<std::string>()) : std::string(),
            lower(topics),
        };
        bool hit = std::any_of(std::begin(fields), std::end(fields), [&](const std::string& f)
                               { return f.find(needle) != std::string::npos; });
        if (!hit)
            continue;

        results.push_back(Json{{"id", repo.at("id")},
                               {"name", repo.at("name")},
                               {"full_name", repo.at("full_name")},
                               {"description", desc},
                               {"language", repo_lang},
                               {"stars", repo.value("stargazers_count", 0)},
                               {"url", string_or_null(repo, "html_url")},
                               {"topics", topics_of(repo)}});
    }

    return Json{{"username", username},
                {"query", query},
                {"language_filter", language ? Json(*language) : Json()},
                {"total_starred", all.size()},
                {"matched_count", results.size()},
                {"results", results}};
}

Json Client::get_repo_info(const std::string& owner, const std::string& repo) const
{
    auto data = get_json(repo_path("/repos/", owner, repo));
    const Json owner_obj = data.value("owner", Json::object());
    return Json{
        {"id", data.at("id")},
        {"name", data.at("name")},
        {"full_name", data.at("full_name")},
        {"description", string_or_null(data, "description")},
        {"language", string_or_null(data, "language")},
        {"stars", data.value("stargazers_count", 0)},
        {"forks", data.value("forks_count", 0)},
        {"watchers", data.value("watchers_count", 0)},
        {"open_issues", data.value("open_issues_count", 0)},
        {"url", string_or_null(data, "html_url")},
        {"clone_url", string_or_null(data, "clone_url")},
        {"ssh_url", string_or_null(data, "ssh_url")},
        {"created_at", string_or_null(data, "created_at")},
        {"updated_at", string_or_null(data, "updated_at")},
        {"pushed_at", string_or_null(data, "pushed_at")},
        {"size", data.value("size", 0)},
        {"topics", topics_of(data)},
        {"license", license_name(data)},
        {"archived", data.value("archived", false)},
        {"disabled", data.value("disabled", false)},
        {"fork", data.value("fork", false)},
        {"default_branch", string_or_null(data, "default_branch")},
        {"owner",
         Json{{"login", string_or_null(owner_obj, "login")},
              {"type", string_or_null(owner_obj, "type")},
              {"url", string_or_null(owner_obj, "html_url")}}},
    };
}

Json Client::check_if_starred(const std::string& owner, const std::string& repo) const
{
    require_token();
    auto response = send("GET", repo_path("/user/starred/", owner, repo));

    bool starred = false;
    switch (response.status_code)
    {
    case 200:
    case 204:
        starred = true;
        break;
    case 404:
        starred = false;
        break;
    case 403:
        throw GitHubError(403, "API rate limit exceeded or insufficient permissions, check the token");
    case 401:
        throw GitHubError(401, "Authentication failed, check the token");
    default:
        throw GitHubError(response.status_code,
                          "API request failed (status " + std::to_string(response.status_code) +
                              "): " + response.body);
    }
    return Json{{"owner", owner}, {"repo", repo}, {"starred", starred}};
}

Json Client::star_repo(const std::string& owner, const std::string& repo) const
{
    require_token();
    auto response = send("PUT", repo_path("/user/starred/", owner, repo));
    if (response.status_code != 204)
        throw GitHubError(response.status_code, "Star failed (status " +
                                                    std::to_string(response.status_code) +
                                                    "): " + response.body);
    return Json{{"owner", owner},
                {"repo", repo},
                {"action", "starred"},
                {"success", true},
                {"message", "Repository starred"}};
}

Json Client::unstar_repo(const std::string& owner, const std::string& repo) const
{
    require_token();
    auto response = send("DELETE", repo_path("/user/starred/", owner, repo));
    if (response.status_code != 204)
        throw GitHubError(response.status_code, "Unstar failed (status " +
                                                    std::to_string(response.status_code) +
                                                    "): " + response.body);
    return Json{{"owner", owner},
                {"repo", repo},
                {"action", "unstarred"},
                {"success", true},
                {"message", "Repository unstarred"}};
}

Json Client::get_starred_stats(const std::string& username) const
{
    auto all = fetch_all_starred(username);

    Tally languages;
    Tally topics;
    Tally licenses;
    long long total_stars = 0;
    long long total_forks = 0;

    for (const auto& repo : all)
    {
        Json lang = string_or_null(repo, "language");
        languages.add(lang.is_string() ? lang.get<std::string>() : "Unknown");

        total_stars += repo.value("stargazers_count", 0LL);
        total_forks += repo.value("forks_count", 0LL);

        for (const auto& t : topics_of(repo))
            if (t.is_string())
                topics.add(t.get<std::string>());

        Json lic = license_name(repo);
        licenses.add(lic.is_string() ? lic.get<std::string>() : "No License");
    }

    const double n = static_cast<double>(all.size());
    return Json{
        {"username", username},
        {"total_starred_repos", all.size()},
        {"total_stars_received", total_stars},
        {"total_forks_received", total_forks},
        {"language_distribution", languages.to_json("language")},
        {"top_topics", topics.to_json("topic", 20)},
        {"license_distribution", licenses.to_json("license")},
        {"avg_stars_per_repo", all.empty() ? 0.0 : round2(total_stars / n)},
        {"avg_forks_per_repo", all.empty() ? 0.0 : round2(total_forks / n)},
    };
}

Json Client::get_repo_languages(const std::string& owner, const std::string& repo) const
{
    auto languages = get_json(repo_path("/repos/", owner, repo) + "/languages");

    long long total_bytes = 0;
    for (const auto& [lang, bytes] : languages.items())
        total_bytes += bytes.get<long long>();

    Json breakdown = Json::object();
    for (const auto& [lang, bytes] : languages.items())
    {
        long long count = bytes.get<long long>();
        double pct = total_bytes > 0 ? static_cast<double>(count) * 100.0 /
                                           static_cast<double>(total_bytes)
                                     : 0.0;
        breakdown[lang] = Json{{"bytes", count}, {"percentage", round2(pct)}};
    }

    return Json{{"owner", owner},
                {"repo", repo},
                {"total_bytes", total_bytes},
                {"languages", breakdown}};
}

} // namespace starmcp::github
