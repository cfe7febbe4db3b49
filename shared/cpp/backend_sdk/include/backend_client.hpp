#pragma once
#include "../../common/include/http.hpp"
#include "../../common/include/retry.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct BackendOptions {
    std::string base_url;
    std::string api_key;   // sent as x-api-key when set
    long timeout_ms{30000};
    RetryPolicy retry;
};

// Shared plumbing of the LLM, image and 3D clients: one HTTP exchange per
// attempt, status/transport errors mapped onto ErrorKind, transient classes
// retried under the injected policy.
class BackendClient {
public:
    BackendClient(std::string name, HttpTransport& transport, BackendOptions opts);
    virtual ~BackendClient() = default;

    const std::string& name() const { return name_; }

    // Longest a single invoke() can take: attempts x timeout + back-off.
    std::chrono::milliseconds worst_case_budget() const;

protected:
    Retried<HttpResponse> post_json(const std::string& path, const nlohmann::json& body,
                                    const CancelToken& cancel);
    Retried<HttpResponse> get_url(const std::string& url, const CancelToken& cancel);
    Retried<HttpResponse> exchange(const HttpRequest& req, const CancelToken& cancel);

    // FastAPI-style {"detail": ...} when present, otherwise a body excerpt.
    static std::string error_detail(const HttpResponse& resp);

    std::string name_;
    HttpTransport& transport_;
    BackendOptions opts_;
    std::string base_origin_;
};
