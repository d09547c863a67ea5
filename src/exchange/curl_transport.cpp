#include "../../include/riskgov/exchange/http_transport.hpp"
#include "../../include/riskgov/errors.hpp"

#include <curl/curl.h>
#include <stdexcept>

namespace riskgov::exchange {

namespace {

// CURL write callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace

CurlTransport::CurlTransport(long timeout_sec)
    : curl_(nullptr)
    , timeout_sec_(timeout_sec) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlTransport::~CurlTransport() {
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
    }
    curl_global_cleanup();
}

HttpResponse CurlTransport::get(const std::string& url, const HttpHeaders& headers) {
    return perform(url, headers, nullptr);
}

HttpResponse CurlTransport::post(const std::string& url, const HttpHeaders& headers, const std::string& body) {
    return perform(url, headers, &body);
}

HttpResponse CurlTransport::perform(const std::string& url, const HttpHeaders& headers, const std::string* body) {
    CURL* curl = static_cast<CURL*>(curl_);
    curl_easy_reset(curl);

    HttpResponse response;

    curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_sec_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Never follow redirects: the signed headers must not reach another host
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 0L);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(header_list);

    if (res != CURLE_OK) {
        throw NetworkError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

} // namespace riskgov::exchange
