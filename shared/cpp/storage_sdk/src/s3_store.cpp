#include "../include/s3_store.hpp"
#include "../../common/include/cancel.hpp"
#include "../../common/include/util.hpp"
#include <algorithm>

namespace {
// S3 error documents look like <Error><Code>NoSuchBucket</Code>...</Error>.
std::string s3_error_code(const std::string& body) {
    auto b = body.find("<Code>");
    auto e = body.find("</Code>");
    if (b == std::string::npos || e == std::string::npos || e < b) return {};
    return body.substr(b + 6, e - b - 6);
}

std::string describe(const std::string& op, const std::string& key, const HttpResponse& resp) {
    std::string msg = op + " " + key + ": HTTP " + std::to_string(resp.status);
    auto code = s3_error_code(resp.body);
    if (!code.empty()) msg += " " + code;
    return msg;
}

ErrorKind storage_kind(TransportFailure failure) {
    switch (failure) {
        case TransportFailure::ConnectFailed:
        case TransportFailure::Timeout:
            return ErrorKind::Transient;
        case TransportFailure::Cancelled:
            return ErrorKind::Cancelled;
        case TransportFailure::Other:
            return ErrorKind::Unexpected;
    }
    return ErrorKind::Unexpected;
}
}

ErrorKind classify_s3_status(long status) {
    if (status == 401 || status == 403) return ErrorKind::Unauthorized;
    if (status >= 500 || status == 429 || status == 408) return ErrorKind::Transient;
    return ErrorKind::Unexpected;
}

S3Store::S3Store(HttpTransport& transport, S3Options opts) : transport_(transport), opts_(std::move(opts)) {
    if (opts_.bucket.empty()) throw ConfigError("S3 bucket name is not configured");
    if (opts_.credentials.access_key_id.empty() || opts_.credentials.secret_access_key.empty()) {
        throw ConfigError("S3 credentials are not configured");
    }
    origin_ = opts_.endpoint.empty() ? "https://s3." + opts_.region + ".amazonaws.com" : opts_.endpoint;
    while (!origin_.empty() && origin_.back() == '/') origin_.pop_back();
    auto scheme = origin_.find("://");
    if (scheme == std::string::npos) throw ConfigError("S3 endpoint needs a scheme: " + origin_);
    host_ = origin_.substr(scheme + 3);
    auto slash = host_.find('/');
    if (slash != std::string::npos) {
        origin_ = origin_.substr(0, scheme + 3 + slash);
        host_ = host_.substr(0, slash);
    }
}

std::string S3Store::canonical_uri(const std::string& key) const {
    return "/" + uri_encode(opts_.bucket, true) + "/" + uri_encode(key, false);
}

std::string S3Store::url_for(const std::string& key) const {
    return origin_ + canonical_uri(key);
}

std::string S3Store::presign_get(const std::string& key, std::chrono::seconds ttl) const {
    auto uri = canonical_uri(key);
    return origin_ + uri + "?" + presign_query("GET", host_, uri, opts_.credentials, opts_.region, "s3",
                                               amz_date(std::chrono::system_clock::now()), static_cast<long>(ttl.count()));
}

HttpResponse S3Store::send_signed(const std::string& method, const std::string& key, const std::string& body,
                                  const std::string& payload_hash,
                                  std::vector<std::pair<std::string, std::string>> extra_headers,
                                  const CancelToken& cancel) {
    const std::string date = amz_date(std::chrono::system_clock::now());
    SigV4Request sreq;
    sreq.method = method;
    sreq.canonical_uri = canonical_uri(key);
    sreq.payload_hash = payload_hash;
    sreq.headers = {
        {"host", host_},
        {"x-amz-content-sha256", payload_hash},
        {"x-amz-date", date}
    };
    if (!opts_.credentials.session_token.empty()) {
        sreq.headers.emplace_back("x-amz-security-token", opts_.credentials.session_token);
    }
    for (auto& h : extra_headers) sreq.headers.push_back(std::move(h));

    HttpRequest req;
    req.method = method;
    req.url = origin_ + sreq.canonical_uri;
    req.body = body;
    req.timeout_ms = opts_.timeout_ms;
    if (auto left = cancel.remaining()) req.timeout_ms = std::max(1L, std::min(req.timeout_ms, static_cast<long>(left->count())));
    req.headers.push_back("Authorization: " + sign_request(sreq, opts_.credentials, opts_.region, "s3", date));
    for (const auto& h : sreq.headers) {
        if (h.first != "host") req.headers.push_back(h.first + ": " + h.second);
    }

    try {
        return transport_.send(req, &cancel);
    } catch (const TransportError& e) {
        throw StorageError(storage_kind(e.failure()), method + " " + key + ": " + e.what());
    }
}

std::optional<ObjectInfo> S3Store::head(const std::string& key, const CancelToken& cancel) {
    auto resp = send_signed("HEAD", key, "", sha256_hex(""), {}, cancel);
    if (resp.status == 404) return std::nullopt;
    if (resp.status < 200 || resp.status >= 300) throw StorageError(classify_s3_status(resp.status), describe("HEAD", key, resp));
    ObjectInfo info;
    info.content_type = resp.content_type;
    info.sha256 = header_value(resp, "x-amz-meta-sha256");
    auto len = header_value(resp, "content-length");
    if (!len.empty()) {
        try { info.size = static_cast<std::size_t>(std::stoull(len)); } catch (const std::exception&) { info.size = 0; }
    }
    return info;
}

void S3Store::write(const std::string& key, const std::string& bytes, const std::string& content_type,
                    const std::string& sha256, const CancelToken& cancel) {
    auto resp = send_signed("PUT", key, bytes, sha256,
                            {{"content-type", content_type}, {"if-none-match", "*"}, {"x-amz-meta-sha256", sha256}},
                            cancel);
    // conditional write lost to another writer
    if (resp.status == 412 || resp.status == 409) throw StorageError(ErrorKind::Conflict, describe("PUT", key, resp));
    if (resp.status < 200 || resp.status >= 300) throw StorageError(classify_s3_status(resp.status), describe("PUT", key, resp));
}

std::optional<StoredObject> S3Store::read(const std::string& key, const CancelToken& cancel) {
    auto resp = send_signed("GET", key, "", sha256_hex(""), {}, cancel);
    if (resp.status == 404) return std::nullopt;
    if (resp.status < 200 || resp.status >= 300) throw StorageError(classify_s3_status(resp.status), describe("GET", key, resp));
    StoredObject obj;
    obj.info.content_type = resp.content_type;
    obj.info.sha256 = header_value(resp, "x-amz-meta-sha256");
    obj.info.size = resp.body.size();
    obj.bytes = std::move(resp.body);
    return obj;
}
