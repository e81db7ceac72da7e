#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace starmcp::github
{

struct HttpRequest
{
    std::string method{"GET"};
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    int timeout_ms{30000};
};

struct HttpResponse
{
    long status_code = 0;
    std::string body;
};

/// Performs one HTTP exchange. Throws TransportError when no response was received.
using HttpFetcher = std::function<HttpResponse(const HttpRequest&)>;

/// libcurl-backed fetcher.
HttpFetcher make_curl_fetcher();

/// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& s);

} // namespace starmcp::github
