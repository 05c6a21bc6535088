#ifndef RUUVI_HTTP_TRANSPORT_H
#define RUUVI_HTTP_TRANSPORT_H

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

enum class TransportError {
    NONE = 0,
    TIMEOUT,
    CONNECTION_FAILED
};

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    uint32_t timeoutMs = 0; // 0 leaves the transport's own defaults in place
};

struct HttpResponse {
    int statusCode = 0;
    std::string body;
    TransportError error = TransportError::NONE;
    std::string errorMessage;
};

// Blocking HTTP GET seam. The device build implements it on top of
// HTTPClient; tests substitute a scripted fake.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

#endif
