#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

std::string getenv_or(const char* key, const std::string& def);

// 128-bit random id rendered as 32 hex characters.
std::string gen_id();

std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split_csv(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

// Characters, not bytes: counts UTF-8 code points.
std::size_t utf8_length(const std::string& s);

// http:// or https:// with a non-empty authority.
bool is_http_url(const std::string& url);
// "scheme://host[:port]" lower-cased, default ports and userinfo dropped.
// Empty when the url has no scheme.
std::string url_origin(const std::string& url);

std::string hex_encode(const std::string& bytes);
std::string sha256_hex(const std::string& data);
std::string hmac_sha256(const std::string& key, const std::string& data); // raw digest
std::string base64_encode(const std::string& bytes);

// "2024-05-01T12:00:00.123Z"
std::string utc_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

long elapsed_ms(std::chrono::steady_clock::time_point since);
