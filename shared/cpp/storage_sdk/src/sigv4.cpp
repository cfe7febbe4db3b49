#include "../include/sigv4.hpp"
#include "../../common/include/util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace {
const char* kAlgorithm = "AWS4-HMAC-SHA256";

std::string scope_of(const std::string& date, const std::string& region, const std::string& service) {
    return date.substr(0, 8) + "/" + region + "/" + service + "/aws4_request";
}

std::string signature(const std::string& canonical, const SigV4Credentials& creds, const std::string& region,
                      const std::string& service, const std::string& date) {
    std::string string_to_sign = std::string(kAlgorithm) + "\n" + date + "\n" +
                                 scope_of(date, region, service) + "\n" + sha256_hex(canonical);
    std::string k = hmac_sha256("AWS4" + creds.secret_access_key, date.substr(0, 8));
    k = hmac_sha256(k, region);
    k = hmac_sha256(k, service);
    k = hmac_sha256(k, "aws4_request");
    return hex_encode(hmac_sha256(k, string_to_sign));
}

std::vector<std::pair<std::string, std::string>> sorted_headers(const SigV4Request& req) {
    std::vector<std::pair<std::string, std::string>> hs;
    for (const auto& h : req.headers) hs.emplace_back(to_lower(h.first), trim(h.second));
    std::sort(hs.begin(), hs.end());
    return hs;
}

std::string signed_header_names(const std::vector<std::pair<std::string, std::string>>& hs) {
    std::string out;
    for (const auto& h : hs) {
        if (!out.empty()) out += ';';
        out += h.first;
    }
    return out;
}
}

std::string uri_encode(const std::string& s, bool encode_slash) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encode_slash)) {
            out.push_back((char)c);
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string amz_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[20];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm);
    return buf;
}

std::string canonical_request(const SigV4Request& req) {
    std::vector<std::pair<std::string, std::string>> q;
    for (const auto& p : req.query) q.emplace_back(uri_encode(p.first, true), uri_encode(p.second, true));
    std::sort(q.begin(), q.end());
    std::string query;
    for (const auto& p : q) {
        if (!query.empty()) query += '&';
        query += p.first + "=" + p.second;
    }

    auto hs = sorted_headers(req);
    std::string headers;
    for (const auto& h : hs) headers += h.first + ":" + h.second + "\n";

    return req.method + "\n" + req.canonical_uri + "\n" + query + "\n" + headers + "\n" +
           signed_header_names(hs) + "\n" + req.payload_hash;
}

std::string sign_request(const SigV4Request& req, const SigV4Credentials& creds,
                         const std::string& region, const std::string& service, const std::string& date) {
    std::string sig = signature(canonical_request(req), creds, region, service, date);
    return std::string(kAlgorithm) + " Credential=" + creds.access_key_id + "/" + scope_of(date, region, service) +
           ", SignedHeaders=" + signed_header_names(sorted_headers(req)) + ", Signature=" + sig;
}

std::string presign_query(const std::string& method, const std::string& host, const std::string& canonical_uri,
                          const SigV4Credentials& creds, const std::string& region, const std::string& service,
                          const std::string& date, long expires_s) {
    SigV4Request req;
    req.method = method;
    req.canonical_uri = canonical_uri;
    req.query = {
        {"X-Amz-Algorithm", kAlgorithm},
        {"X-Amz-Credential", creds.access_key_id + "/" + scope_of(date, region, service)},
        {"X-Amz-Date", date},
        {"X-Amz-Expires", std::to_string(expires_s)},
        {"X-Amz-SignedHeaders", "host"}
    };
    if (!creds.session_token.empty()) req.query.emplace_back("X-Amz-Security-Token", creds.session_token);
    req.headers = {{"host", host}};
    req.payload_hash = "UNSIGNED-PAYLOAD";

    std::string sig = signature(canonical_request(req), creds, region, service, date);
    std::string out;
    for (const auto& p : req.query) {
        if (!out.empty()) out += '&';
        out += uri_encode(p.first, true) + "=" + uri_encode(p.second, true);
    }
    return out + "&X-Amz-Signature=" + sig;
}
