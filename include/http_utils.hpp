#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <curl/curl.h>
#include <chrono>
#include <string>
#include <vector>

/**
 * @brief RAII wrapper for a CURL easy handle.
 *
 * The first instance performs `curl_global_init` once for the process.
 */
class CurlHandle {
  public:
    CurlHandle();
    ~CurlHandle();
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return handle_; }

  private:
    CURL* handle_;
};

/// RAII wrapper around a curl header list.
struct CurlSlist {
    curl_slist* list{nullptr};
    CurlSlist() = default;
    ~CurlSlist() { curl_slist_free_all(list); }
    void append(const std::string& s) { list = curl_slist_append(list, s.c_str()); }
    curl_slist* get() const { return list; }
    CurlSlist(const CurlSlist&) = delete;
    CurlSlist& operator=(const CurlSlist&) = delete;
};

struct HttpResponse {
    long status = 0;   ///< HTTP status, 0 when no response arrived
    std::string body;
    std::string error; ///< Transport error text, empty when a response arrived
};

/**
 * @brief Perform one HTTP request.
 *
 * HTTP error statuses are not treated as failures; the caller inspects
 * `status` and `body`. Only transport problems fill `error`.
 *
 * @param method  Verb such as "GET" or "POST".
 * @param url     Absolute URL.
 * @param headers Raw header lines (`Name: value`).
 * @param body    Request body, sent when non-empty.
 * @param timeout Whole-request timeout, zero for none.
 */
HttpResponse http_request(const std::string& method, const std::string& url,
                          const std::vector<std::string>& headers, const std::string& body = {},
                          std::chrono::seconds timeout = std::chrono::seconds(0));

#endif // HTTP_UTILS_HPP
