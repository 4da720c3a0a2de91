#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace warden::services {

// Liveness of a sibling service. Only the HTTP status code matters.
class HealthProbe {
public:
    virtual ~HealthProbe() = default;

    // HTTP status, or 0 when no response arrived in time
    virtual int check() = 0;
};

/**
 * HTTP GET through libcurl with one timeout covering connect and
 * transfer. Only http:// URLs are accepted.
 */
class HttpHealthProbe : public HealthProbe {
public:
    // Throws std::invalid_argument on a malformed or non-http URL
    HttpHealthProbe(const std::string& url, std::chrono::milliseconds timeout);

    int check() override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    const std::string& path() const { return path_; }

private:
    std::string url_;
    std::string host_;
    uint16_t port_ = 80;
    std::string path_ = "/";
    std::chrono::milliseconds timeout_;
};

} // namespace warden::services
