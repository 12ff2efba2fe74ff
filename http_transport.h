#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace gptcli {

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

/// Raised when no HTTP response was obtained (connection refused, DNS, timeout...).
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& what, bool timed_out)
        : std::runtime_error(what), m_timed_out(timed_out) {}

    bool timedOut() const { return m_timed_out; }

private:
    bool m_timed_out;
};

// Abstract base class for the network call, so the request path can be
// exercised without a network.
class HttpTransport {
public:
    // Sends `body` as an HTTP POST. Any HTTP status is returned, not thrown.
    // Throws TransportError if the exchange could not complete.
    virtual HttpResponse post(const std::string& url,
                              const std::vector<std::string>& headers,
                              const std::string& body) = 0;

    virtual ~HttpTransport() = default;
};

// libcurl implementation. One easy handle per request, released on return.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_seconds = 120);

    HttpResponse post(const std::string& url,
                      const std::vector<std::string>& headers,
                      const std::string& body) override;

private:
    long m_timeout_seconds;
};

} // namespace gptcli
