#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <vector>

// AWS Signature Version 4, as used by S3-compatible object stores.

struct SigV4Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token; // optional
};

struct SigV4Request {
    std::string method;
    std::string canonical_uri; // already URI-encoded path, e.g. "/bucket/images/a.png"
    std::vector<std::pair<std::string, std::string>> query;   // raw names/values
    std::vector<std::pair<std::string, std::string>> headers; // every header to sign, "host" included
    std::string payload_hash; // hex SHA-256 of the body, or "UNSIGNED-PAYLOAD"
};

// RFC 3986 unreserved characters pass through; everything else is %XX.
std::string uri_encode(const std::string& s, bool encode_slash);

// "20130524T000000Z"
std::string amz_date(std::chrono::system_clock::time_point tp);

std::string canonical_request(const SigV4Request& req);

// Value for the Authorization header.
std::string sign_request(const SigV4Request& req, const SigV4Credentials& creds,
                         const std::string& region, const std::string& service, const std::string& date);

// Query string of a presigned URL (X-Amz-* parameters plus X-Amz-Signature).
std::string presign_query(const std::string& method, const std::string& host, const std::string& canonical_uri,
                          const SigV4Credentials& creds, const std::string& region, const std::string& service,
                          const std::string& date, long expires_s);
