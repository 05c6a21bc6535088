#ifndef RUUVI_FAKE_HTTP_TRANSPORT_H
#define RUUVI_FAKE_HTTP_TRANSPORT_H

#include <deque>
#include <functional>
#include <string>
#include <vector>
#include "HttpTransport.h"

// Scripted transport: replays queued responses and records every request.
class FakeHttpTransport : public HttpTransport {
public:
    std::vector<HttpRequest> requests;
    std::deque<HttpResponse> responses;
    // Runs inside get(), before the response is returned.
    std::function<void()> onGet;

    void respond(int statusCode, const std::string& body) {
        HttpResponse response;
        response.statusCode = statusCode;
        response.body = body;
        responses.push_back(response);
    }

    void failWith(TransportError error, const std::string& message) {
        HttpResponse response;
        response.error = error;
        response.errorMessage = message;
        responses.push_back(response);
    }

    HttpResponse get(const HttpRequest& request) override {
        requests.push_back(request);
        if (onGet) onGet();
        if (responses.empty()) {
            HttpResponse refused;
            refused.error = TransportError::CONNECTION_FAILED;
            refused.errorMessage = "no scripted response";
            return refused;
        }
        HttpResponse response = responses.front();
        responses.pop_front();
        return response;
    }

    const std::string* header(size_t index, const std::string& name) const {
        for (const auto& h : requests.at(index).headers) {
            if (h.first == name) return &h.second;
        }
        return nullptr;
    }
};

#endif
