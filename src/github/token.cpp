#include "starmcp/github/token.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace starmcp::github
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::optional<std::string> from_access_token_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        return std::nullopt;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.rfind("github_pat_", 0) == 0)
            return line;
    }
    return std::nullopt;
}

std::optional<std::string> from_token_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        return std::nullopt;
    std::stringstream buf;
    buf << in.rdbuf();
    std::string token = trim(buf.str());
    if (token.empty() || token[0] == '#')
        return std::nullopt;
    return token;
}

} // namespace

std::optional<std::string> resolve_token(const std::filesystem::path& directory)
{
    if (auto t = from_access_token_file(directory / ACCESS_TOKEN_FILE))
        return t;
    if (auto t = from_token_file(directory / TOKEN_FILE))
        return t;
    if (const char* v = std::getenv(TOKEN_ENV); v != nullptr && v[0] != '\0')
        return std::string(v);
    return std::nullopt;
}

} // namespace starmcp::github
