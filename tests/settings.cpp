#include "starmcp/exceptions.hpp"
#include "starmcp/settings.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <string>

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value)
{
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

static void unset_env(const char* name)
{
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

int main()
{
    using namespace starmcp;

    // Defaults
    {
        Settings s;
        assert(s.host == "localhost");
        assert(s.port == 38000);
        assert(s.heartbeat_interval == std::chrono::seconds(30));
        assert(s.server_info.name == "github_star_classifier");
        assert(s.server_info.version == "1.0.0");
        assert(s.toolset == "github");
        assert(!s.github_token);
        assert(s.tool_enabled("anything"));
        assert(s.max_sse_connections == 100);
    }

    // JSON layout
    {
        Json cfg = {
            {"server", {{"name", "stars"}, {"version", "2.0.0"}, {"host", "0.0.0.0"}, {"port", 9000}}},
            {"logging", {{"level", "DEBUG"}}},
            {"sse", {{"heartbeat_interval", 5}}},
            {"cors", {{"allowed_origins", Json::array({"http://example.com"})}}},
            {"github", {{"token", "ghp_x"}, {"timeout", 10}, {"api_url", "http://gh.local"}}},
            {"tools",
             {{"default_per_page", 10},
              {"max_per_page", 50},
              {"max_repos_for_analysis", 200},
              {"enabled_tools", {{"star_repo", false}}}}},
        };
        auto s = Settings::from_json(cfg);
        assert(s.server_info.name == "stars");
        assert(s.server_info.version == "2.0.0");
        assert(s.host == "0.0.0.0");
        assert(s.port == 9000);
        assert(s.log_level == "DEBUG");
        assert(s.heartbeat_interval == std::chrono::seconds(5));
        assert(s.cors_origin == "http://example.com");
        assert(s.github_token && *s.github_token == "ghp_x");
        assert(s.github_timeout_ms == 10000);
        assert(s.github_api_url == "http://gh.local");
        assert(s.default_per_page == 10);
        assert(s.max_per_page == 50);
        assert(s.max_repos_for_analysis == 200);
        assert(!s.tool_enabled("star_repo"));
        assert(s.tool_enabled("unstar_repo"));
    }

    // Empty token in the file is ignored
    {
        auto s = Settings::from_json(Json{{"github", {{"token", ""}}}});
        assert(!s.github_token);
    }

    // Wrong types surface as ConfigError
    {
        bool threw = false;
        try
        {
            Settings::from_json(Json{{"server", {{"port", "not-a-number"}}}});
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
    }

    // Non-positive heartbeat or stream limit in the file
    {
        for (int bad : {0, -1})
        {
            bool threw = false;
            try
            {
                Settings::from_json(Json{{"sse", {{"heartbeat_interval", bad}}}});
            }
            catch (const ConfigError&)
            {
                threw = true;
            }
            assert(threw);

            threw = false;
            try
            {
                Settings::from_json(Json{{"sse", {{"max_connections", bad}}}});
            }
            catch (const ConfigError&)
            {
                threw = true;
            }
            assert(threw);
        }
        auto s = Settings::from_json(Json{{"sse", {{"max_connections", 4}}}});
        assert(s.max_sse_connections == 4);
        assert(s.heartbeat_interval == std::chrono::seconds(30));
    }

    // Env overrides the base (uppercased log level)
    {
        set_env("STARMCP_LOG_LEVEL", "warn");
        set_env("STARMCP_PORT", "4242");
        set_env("STARMCP_HEARTBEAT_SECONDS", "7");
        set_env("GITHUB_TOKEN", "env_token");
        Settings base;
        base.host = "from-file";
        auto s = Settings::from_env(base);
        assert(s.log_level == "WARN");
        assert(s.port == 4242);
        assert(s.heartbeat_interval == std::chrono::seconds(7));
        assert(s.host == "from-file");
        // Left to github::resolve_token(), which ranks the token files first
        assert(!s.github_token);

        set_env("STARMCP_PORT", "12ab");
        bool threw = false;
        try
        {
            Settings::from_env();
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);

        // Non-positive heartbeat is rejected
        set_env("STARMCP_PORT", "4242");
        for (const char* bad : {"0", "-5"})
        {
            set_env("STARMCP_HEARTBEAT_SECONDS", bad);
            threw = false;
            try
            {
                Settings::from_env();
            }
            catch (const ConfigError&)
            {
                threw = true;
            }
            assert(threw);
        }

        unset_env("STARMCP_LOG_LEVEL");
        unset_env("STARMCP_PORT");
        unset_env("STARMCP_HEARTBEAT_SECONDS");
        unset_env("GITHUB_TOKEN");
    }

    // File loading
    {
        const char* path = "starmcp_settings_test.json";
        {
            std::ofstream out(path);
            out << R"({"server": {"port": 38123}, "tools": {"toolset": "stars"}})";
        }
        auto s = Settings::from_file(path);
        assert(s.port == 38123);
        assert(s.toolset == "stars");

        {
            std::ofstream out(path);
            out << "{ not json";
        }
        bool threw = false;
        try
        {
            Settings::from_file(path);
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
        std::remove(path);

        threw = false;
        try
        {
            Settings::from_file("does/not/exist.json");
        }
        catch (const ConfigError&)
        {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
