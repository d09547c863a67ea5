#pragma once

#include <map>
#include <string>

namespace riskgov {
namespace exchange {

struct HttpResponse {
    long status = 0;
    std::string body;
};

using HttpHeaders = std::map<std::string, std::string>;

/**
 * HttpTransport - the only network-capable seam used by LiveClient.
 *
 * Implementations throw NetworkError on transport failure (DNS, connect,
 * TLS, timeout). HTTP status codes are returned, not thrown.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers) = 0;
    virtual HttpResponse post(const std::string& url, const HttpHeaders& headers, const std::string& body) = 0;
};

/**
 * libcurl-backed transport. One easy handle, reused across requests.
 * Every request is bounded by timeout_sec.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_sec = 10);
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse get(const std::string& url, const HttpHeaders& headers) override;
    HttpResponse post(const std::string& url, const HttpHeaders& headers, const std::string& body) override;

private:
    HttpResponse perform(const std::string& url, const HttpHeaders& headers, const std::string* body);

    void* curl_; // CURL*, kept opaque so curl.h stays out of headers
    long timeout_sec_;
};

} // namespace exchange
} // namespace riskgov
