#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace starmcp::github
{

constexpr const char* ACCESS_TOKEN_FILE = "starring_accessed_token";
constexpr const char* TOKEN_FILE = "github_token.txt";
constexpr const char* TOKEN_ENV = "GITHUB_TOKEN";

/**
 * Finds the default GitHub token, checked in this order:
 * 1. the first line starting with "github_pat_" in `starring_accessed_token`
 * 2. the trimmed contents of `github_token.txt`, unless empty or starting with '#'
 * 3. the GITHUB_TOKEN environment variable
 *
 * Files are looked up in `directory`. Re-reads on every call so a token can be
 * dropped in without restarting the server.
 */
std::optional<std::string> resolve_token(const std::filesystem::path& directory = ".");

} // namespace starmcp::github
