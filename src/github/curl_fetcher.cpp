#include "starmcp/exceptions.hpp"
#include "starmcp/github/http_fetcher.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdio>
#include <mutex>

namespace starmcp::github
{

namespace
{

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata)
{
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse curl_perform(const HttpRequest& request)
{
    ensure_curl_initialized();

    CURL* curl = curl_easy_init();
    if (!curl)
        throw TransportError("curl_easy_init failed");

    struct curl_slist* hdrs = nullptr;
    for (const auto& h : request.headers)
        hdrs = curl_slist_append(hdrs, h.c_str());

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.timeout_ms > 0 ? request.timeout_ms : 0));

    if (request.method == "PUT")
    {
        // Empty body with an explicit Content-Length: 0
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
    }
    else if (request.method != "GET")
    {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK)
    {
        std::string err = curl_easy_strerror(rc);
        curl_slist_free_all(hdrs);
        curl_easy_cleanup(curl);
        throw TransportError("Network request error: " + err);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace

HttpFetcher make_curl_fetcher()
{
    return [](const HttpRequest& request) { return curl_perform(request); };
}

std::string url_encode(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace starmcp::github
