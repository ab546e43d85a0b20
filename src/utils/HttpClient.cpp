#include "HttpClient.hpp"

#include <cpr/cpr.h>

#include <atomic>

namespace
{

inline void apply_common(cpr::Session& s, const utils::HttpRequestConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

inline cpr::Header make_header(const std::vector<utils::HttpHeader>& headers)
{
    cpr::Header h;
    for (const auto& kv : headers)
    {
        h.emplace(kv.name, kv.value);
    }
    return h;
}

inline void fill_error(utils::HttpResponse& hr, const cpr::Response& r)
{
    hr.error = r.error.message.empty() ? "transport error" : r.error.message;
    hr.timed_out = r.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT;
}

} // namespace

namespace utils
{

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<HttpHeader>& headers,
                                const HttpRequestConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        fill_error(hr, r);
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

HttpResponse CprHttpClient::stream(const std::string& url, const std::vector<HttpHeader>& headers,
                                   const HttpRequestConfig& cfg, const ChunkHandler& onChunk)
{
    std::atomic<std::size_t> total{ 0 };
    bool aborted = false;

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    s.SetProgressCallback(cpr::ProgressCallback{
        [&total](cpr::cpr_pf_arg_t downloadTotal, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t,
                 intptr_t) -> bool
        {
            if (downloadTotal > 0)
            {
                total = static_cast<std::size_t>(downloadTotal);
            }
            return true;
        } });
    s.SetWriteCallback(cpr::WriteCallback{
        [&](std::string_view data, intptr_t) -> bool
        {
            if (!onChunk(data, total.load()))
            {
                aborted = true;
                return false;
            }
            return true;
        } });

    auto r = s.Get();
    HttpResponse hr;
    hr.aborted = aborted;
    hr.status_code = static_cast<int>(r.status_code);
    if (r.error && !aborted)
    {
        fill_error(hr, r);
    }
    return hr;
}

} // namespace utils
