#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace utils
{

struct HttpHeader
{
    std::string name;
    std::string value;
};

struct HttpRequestConfig
{
    int connect_timeout_ms = 10000;
    int timeout_ms = 30000; // whole-transfer limit for this request
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    bool timed_out = false;
    bool aborted = false; // the chunk handler asked to stop

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Receives each body chunk as it arrives; totalBytes is 0 while unknown.
// Returning false aborts the transfer.
using ChunkHandler = std::function<bool(std::string_view chunk, std::size_t totalBytes)>;

class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // Buffered GET, body returned in HttpResponse::text
    virtual HttpResponse get(const std::string& url, const std::vector<HttpHeader>& headers,
                             const HttpRequestConfig& cfg) = 0;

    // Streaming GET, body delivered to onChunk and never buffered
    virtual HttpResponse stream(const std::string& url, const std::vector<HttpHeader>& headers,
                                const HttpRequestConfig& cfg, const ChunkHandler& onChunk) = 0;
};

class CprHttpClient : public IHttpClient
{
public:
    HttpResponse get(const std::string& url, const std::vector<HttpHeader>& headers,
                     const HttpRequestConfig& cfg) override;

    HttpResponse stream(const std::string& url, const std::vector<HttpHeader>& headers,
                        const HttpRequestConfig& cfg, const ChunkHandler& onChunk) override;
};

} // namespace utils
