#include "services/health_check.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <memory>
#include <stdexcept>

namespace warden::services {

namespace {

// Only the status code is used; the body is read and dropped
size_t discard_body(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

} // anonymous namespace

HttpHealthProbe::HttpHealthProbe(const std::string& url, std::chrono::milliseconds timeout)
    : url_(url), timeout_(timeout) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("health URL must start with http://: " + url);
    }

    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        path_ = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        host_ = authority.substr(0, colon);
        try {
            int port = std::stoi(authority.substr(colon + 1));
            if (port <= 0 || port > 65535) {
                throw std::out_of_range("port");
            }
            port_ = static_cast<uint16_t>(port);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("bad port in health URL: " + url);
        }
    } else {
        host_ = authority;
    }

    if (host_.empty()) {
        throw std::invalid_argument("no host in health URL: " + url);
    }
}

int HttpHealthProbe::check() {
    static CurlGlobal global;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        spdlog::warn("Health probe: curl_easy_init failed");
        return 0;
    }

    long timeout_ms = static_cast<long>(timeout_.count());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    // Called from worker threads
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    // Sibling services are local; never route through *_proxy from the environment
    curl_easy_setopt(curl.get(), CURLOPT_PROXY, "");
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "warden-health/1.0");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        spdlog::debug("Health probe {} failed: {}", url_, curl_easy_strerror(rc));
        return 0;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    return static_cast<int>(status);
}

} // namespace warden::services
