#include "http_utils.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "logger.hpp"

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string format_curl_error(const std::string& verb, const std::string& url, CURLcode code,
                              const char* errbuf) {
    std::ostringstream oss;
    oss << "curl " << verb;
    if (!url.empty())
        oss << ' ' << url;
    oss << " failed: " << curl_easy_strerror(code);
    if (errbuf != nullptr && errbuf[0] != '\0')
        oss << " - " << errbuf;
    return oss.str();
}

} // namespace

CurlHandle::CurlHandle() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    handle_ = curl_easy_init();
    if (!handle_)
        throw std::runtime_error("Failed to init curl");
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

HttpResponse http_request(const std::string& method, const std::string& url,
                          const std::vector<std::string>& headers, const std::string& body,
                          std::chrono::seconds timeout) {
    HttpResponse resp;
    CURL* curl = nullptr;
    std::unique_ptr<CurlHandle> handle;
    try {
        handle = std::make_unique<CurlHandle>();
        curl = handle->get();
    } catch (const std::runtime_error& e) {
        resp.error = e.what();
        return resp;
    }
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (!body.empty() || method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    }
    CurlSlist header_list;
    for (const auto& h : headers)
        header_list.append(h);
    // No 100-continue round trip for large bodies.
    header_list.append("Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

    log_debug("HTTP request", {{"method", method}, {"url", url}});
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        resp.error = format_curl_error(method, url, res, errbuf);
        log_error("HTTP request failed", {{"method", method}, {"error", resp.error}});
        return resp;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    log_debug("HTTP response", {{"method", method},
                                {"url", url},
                                {"status", std::to_string(resp.status)},
                                {"bytes", std::to_string(resp.body.size())}});
    return resp;
}
