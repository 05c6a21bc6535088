#include "GatewayHttpTransport.h"
#include <WiFi.h>
#include "AppLogger.h"

GatewayHttpTransport::GatewayHttpTransport() {
    _http.setReuse(true);
}

HttpResponse GatewayHttpTransport::get(const HttpRequest& request) {
    HttpResponse response;

    if (WiFi.status() != WL_CONNECTED) {
        response.error = TransportError::CONNECTION_FAILED;
        response.errorMessage = "WiFi not connected";
        return response;
    }

    if (request.timeoutMs > 0) {
        uint32_t timeoutMs = request.timeoutMs > 0xFFFF ? 0xFFFF : request.timeoutMs;
        _http.setConnectTimeout(static_cast<int32_t>(timeoutMs));
        _http.setTimeout(static_cast<uint16_t>(timeoutMs));
    }

    if (!_http.begin(String(request.url.c_str()))) {
        response.error = TransportError::CONNECTION_FAILED;
        response.errorMessage = "Invalid URL " + request.url;
        return response;
    }

    for (const auto& header : request.headers) {
        _http.addHeader(String(header.first.c_str()), String(header.second.c_str()));
    }

    int httpCode = _http.GET();
    if (httpCode < 0) {
        response.error = httpCode == HTTPC_ERROR_READ_TIMEOUT ? TransportError::TIMEOUT
                                                              : TransportError::CONNECTION_FAILED;
        response.errorMessage = HTTPClient::errorToString(httpCode).c_str();
        LOG_DEBUG("gateway", "HTTP transport error " + String(httpCode) + ": " + HTTPClient::errorToString(httpCode));
        _http.end();
        return response;
    }

    response.statusCode = httpCode;
    String body = _http.getString();
    response.body.assign(body.c_str(), body.length());
    _http.end();
    return response;
}
