#pragma once
#include <Arduino.h>
#include <HTTPClient.h>
#include <HttpTransport.h>

// HttpTransport backed by the ESP32 HTTPClient. The connection is kept
// alive between polls.
class GatewayHttpTransport : public HttpTransport {
public:
    GatewayHttpTransport();

    HttpResponse get(const HttpRequest& request) override;

private:
    HTTPClient _http;
};
