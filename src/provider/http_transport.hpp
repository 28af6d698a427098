#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace warden::provider {

using HeaderMap = std::unordered_map<std::string, std::string>;

struct HttpResponse {
    long status = 0;
    std::string body;
    // Keys are lower-cased.
    HeaderMap headers;
    bool timeout = false;
    bool cancelled = false;
    bool network_error = false;
    std::string network_error_message;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post_json(const std::string& url, const HeaderMap& headers,
                                   const std::string& body, std::uint64_t timeout_ms,
                                   const std::shared_ptr<std::atomic_bool>& cancel_token) = 0;
};

class CurlHttpTransport final : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse post_json(const std::string& url, const HeaderMap& headers,
                           const std::string& body, std::uint64_t timeout_ms,
                           const std::shared_ptr<std::atomic_bool>& cancel_token) override;
};

}  // namespace warden::provider
