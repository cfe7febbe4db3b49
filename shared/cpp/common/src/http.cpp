#include "../include/http.hpp"
#include "../include/cancel.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <array>
#include <mutex>
#include <stdexcept>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userp) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userp);
    std::string line(buffer, total);
    // A new status line starts a fresh header block (redirects, 100-continue).
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos) return total;
    std::string name = to_lower(trim(line.substr(0, colon)));
    (*headers)[name] = trim(line.substr(colon + 1));
    return total;
}

int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancelToken*>(clientp);
    return (cancel && cancel->cancelled()) ? 1 : 0;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
    void append(const std::string& h) { list = curl_slist_append(list, h.c_str()); }
};

TransportFailure classify(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PARTIAL_FILE:
            return TransportFailure::ConnectFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFailure::Timeout;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportFailure::Cancelled;
        default:
            return TransportFailure::Other;
    }
}
}

struct CurlTransport::Shared {
    CURLSH* share{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userp) {
        static_cast<Shared*>(userp)->locks[data].lock();
    }
    static void unlock_cb(CURL*, curl_lock_data data, void* userp) {
        static_cast<Shared*>(userp)->locks[data].unlock();
    }
};

CurlTransport::CurlTransport() : shared_(new Shared) {
    shared_->share = curl_share_init();
    if (!shared_->share) throw std::runtime_error("curl_share_init failed");
    curl_share_setopt(shared_->share, CURLSHOPT_LOCKFUNC, &Shared::lock_cb);
    curl_share_setopt(shared_->share, CURLSHOPT_UNLOCKFUNC, &Shared::unlock_cb);
    curl_share_setopt(shared_->share, CURLSHOPT_USERDATA, shared_.get());
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(shared_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

CurlTransport::~CurlTransport() {
    if (shared_ && shared_->share) curl_share_cleanup(shared_->share);
}

HttpResponse CurlTransport::send(const HttpRequest& req, const CancelToken* cancel) {
    if (cancel && cancel->cancelled()) {
        throw TransportError(TransportFailure::Cancelled, "request cancelled before dispatch");
    }

    CurlHandle c;
    HeaderList headers;
    for (const auto& h : req.headers) headers.append(h);
    if (!req.body.empty()) headers.append("Expect:");

    HttpResponse resp;
    curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_SHARE, shared_->share);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(c.h, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(c.h, CURLOPT_HEADERDATA, &resp.headers);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    // plain HTTP(S) only, redirects included
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(c.h, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(c.h, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(c.h, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(c.h, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, cancel);

    if (req.method == "HEAD") {
        curl_easy_setopt(c.h, CURLOPT_NOBODY, 1L);
    } else if (req.method == "POST" || req.method == "PUT") {
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)req.body.size());
        if (req.method == "PUT") curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, "PUT");
    } else if (req.method != "GET") {
        curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    }

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        TransportFailure failure = classify(code);
        // A run deadline surfaces through the progress callback; report it as
        // a cancellation rather than a per-attempt timeout.
        if (cancel && cancel->cancelled()) failure = TransportFailure::Cancelled;
        throw TransportError(failure, std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    char* ctype = nullptr;
    curl_easy_getinfo(c.h, CURLINFO_CONTENT_TYPE, &ctype);
    if (ctype) resp.content_type = ctype;
    return resp;
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

std::string header_value(const HttpResponse& resp, const std::string& name) {
    auto it = resp.headers.find(to_lower(name));
    return it == resp.headers.end() ? std::string() : it->second;
}
