#include "NetworkClient.hpp"

#include "Errors.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>

#include <cstdint>
#include <string>
#include <utility>

namespace {
bool IsErrorStatus(const cpr::Response& response) {
    return response.status_code >= 400;
}

cpr::Header BuildHeaders(const std::string& traceparent, bool withBody) {
    cpr::Header headers{{"Accept", "application/json"}};
    if (withBody) {
        headers["Content-Type"] = "application/json";
    }
    if (!traceparent.empty()) {
        headers["traceparent"] = traceparent;
    }
    return headers;
}

nlohmann::json ParseBody(const std::string& method, const std::string& url, const cpr::Response& response) {
    auto json = nlohmann::json::parse(response.text, nullptr, false);
    if (json.is_discarded()) {
        throw TransportError(
            method + " " + url + " returned a non-JSON body (HTTP " + std::to_string(response.status_code) + ")");
    }
    return json;
}
} // namespace

NetworkClient::NetworkClient(ClientTimeouts timeouts)
    : timeouts_(std::move(timeouts)) {}

nlohmann::json NetworkClient::Get(const std::string& url) const {
    ScopedSpan span("onlyone.client.get");
    span.SetAttribute("http.method", "GET");
    span.SetAttribute("http.url", url);

    cpr::Response response = cpr::Get(
        cpr::Url{url},
        BuildHeaders(span.TraceParent(), false),
        cpr::ConnectTimeout{timeouts_.connect},
        cpr::Timeout{timeouts_.request});

    span.SetAttribute("http.status_code", static_cast<int64_t>(response.status_code));
    if (response.error.code != cpr::ErrorCode::OK) {
        throw TransportError("GET " + url + " failed: " + response.error.message);
    }

    nlohmann::json json = ParseBody("GET", url, response);
    if (!IsErrorStatus(response)) {
        span.MarkSuccess();
    }
    return json;
}

nlohmann::json NetworkClient::Post(const std::string& url, const nlohmann::json& payload) const {
    ScopedSpan span("onlyone.client.post");
    span.SetAttribute("http.method", "POST");
    span.SetAttribute("http.url", url);

    cpr::Response response = cpr::Post(
        cpr::Url{url},
        cpr::Body{payload.dump()},
        BuildHeaders(span.TraceParent(), true),
        cpr::ConnectTimeout{timeouts_.connect},
        cpr::Timeout{timeouts_.request});

    span.SetAttribute("http.status_code", static_cast<int64_t>(response.status_code));
    if (response.error.code != cpr::ErrorCode::OK) {
        throw TransportError("POST " + url + " failed: " + response.error.message);
    }

    nlohmann::json json = ParseBody("POST", url, response);
    if (!IsErrorStatus(response)) {
        span.MarkSuccess();
    }
    return json;
}

std::optional<nlohmann::json> NetworkClient::Probe(const std::string& url) const {
    ScopedSpan span("onlyone.probe");
    span.SetAttribute("http.method", "GET");
    span.SetAttribute("http.url", url);

    cpr::Response response = cpr::Get(
        cpr::Url{url},
        BuildHeaders(span.TraceParent(), false),
        cpr::ConnectTimeout{timeouts_.connect},
        cpr::Timeout{timeouts_.request});

    span.SetAttribute("http.status_code", static_cast<int64_t>(response.status_code));
    if (response.error.code != cpr::ErrorCode::OK || IsErrorStatus(response)) {
        return std::nullopt;
    }

    auto json = nlohmann::json::parse(response.text, nullptr, false);
    if (json.is_discarded()) {
        return std::nullopt;
    }

    span.MarkSuccess();
    return json;
}
