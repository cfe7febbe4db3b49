#include "../include/backend_client.hpp"
#include "../../common/include/log.hpp"
#include "../../common/include/util.hpp"
#include <algorithm>

using json = nlohmann::json;

BackendClient::BackendClient(std::string name, HttpTransport& transport, BackendOptions opts)
    : name_(std::move(name)), transport_(transport), opts_(std::move(opts)) {
    if (!opts_.base_url.empty() && opts_.base_url.back() == '/') opts_.base_url.pop_back();
    base_origin_ = url_origin(opts_.base_url);
}

std::chrono::milliseconds BackendClient::worst_case_budget() const {
    int attempts = std::max(1, opts_.retry.max_attempts);
    return std::chrono::milliseconds(opts_.timeout_ms * attempts) + opts_.retry.worst_case_backoff();
}

Retried<HttpResponse> BackendClient::post_json(const std::string& path, const json& body,
                                               const CancelToken& cancel) {
    HttpRequest req;
    req.method = "POST";
    req.url = opts_.base_url + path;
    req.headers.push_back("Content-Type: application/json");
    req.body = body.dump();
    req.timeout_ms = opts_.timeout_ms;
    return exchange(req, cancel);
}

Retried<HttpResponse> BackendClient::get_url(const std::string& url, const CancelToken& cancel) {
    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.timeout_ms = opts_.timeout_ms;
    req.follow_redirects = true;
    return exchange(req, cancel);
}

Retried<HttpResponse> BackendClient::exchange(const HttpRequest& base, const CancelToken& cancel) {
    // the key only goes to the configured service, never to a URL it hands back
    const bool with_key = !opts_.api_key.empty() && !base_origin_.empty() && url_origin(base.url) == base_origin_;
    return run_with_retry<HttpResponse>(opts_.retry, cancel, name_, [&](int attempt) -> Attempt<HttpResponse> {
        HttpRequest req = base;
        if (with_key) req.headers.push_back("x-api-key: " + opts_.api_key);
        log_debug(name_, req.method + " " + req.url + " attempt=" + std::to_string(attempt));
        if (auto left = cancel.remaining()) {
            req.timeout_ms = std::max(1L, std::min(req.timeout_ms, (long)left->count()));
        }
        try {
            HttpResponse resp = transport_.send(req, &cancel);
            if (resp.status >= 200 && resp.status < 300) return Attempt<HttpResponse>::ok(std::move(resp));
            return Attempt<HttpResponse>::fail(classify_http_status(resp.status),
                                               name_ + " returned HTTP " + std::to_string(resp.status) +
                                               ": " + error_detail(resp));
        } catch (const TransportError& e) {
            return Attempt<HttpResponse>::fail(classify_transport(e.failure()), name_ + ": " + e.what());
        } catch (const std::exception& e) {
            return Attempt<HttpResponse>::fail(ErrorKind::Unexpected, name_ + ": " + e.what());
        }
    });
}

std::string BackendClient::error_detail(const HttpResponse& resp) {
    auto j = json::parse(resp.body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        for (const char* field : {"detail", "error", "message"}) {
            if (j.contains(field)) {
                return j[field].is_string() ? j[field].get<std::string>() : j[field].dump();
            }
        }
    }
    if (resp.body.empty()) return "(empty body)";
    return resp.body.substr(0, 200);
}
