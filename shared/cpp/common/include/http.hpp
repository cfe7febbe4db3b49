#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

class CancelToken;

struct HttpRequest {
    std::string method{"GET"};          // GET | POST | PUT | HEAD
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
    long timeout_ms{30000};
    bool follow_redirects{false};
};

struct HttpResponse {
    long status{0};
    std::string body;
    std::string content_type;
    std::map<std::string, std::string> headers; // names lower-cased
};

// Blocking HTTP exchange. Throws TransportError when no response arrives
// (connect failure, timeout, cancellation). Implementations must be safe to
// call from several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& req, const CancelToken* cancel) = 0;
};

// libcurl transport. One easy handle per request; DNS and connection caches
// are shared across threads through a curl share handle.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse send(const HttpRequest& req, const CancelToken* cancel) override;

private:
    struct Shared;
    std::unique_ptr<Shared> shared_;
};

// RAII around curl_global_init/cleanup; create one in main() before any thread.
struct CurlGlobal {
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// Lower-cased header value lookup, empty if absent.
std::string header_value(const HttpResponse& resp, const std::string& name);
