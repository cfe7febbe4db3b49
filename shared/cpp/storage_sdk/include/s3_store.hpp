#pragma once
#include "object_store.hpp"
#include "sigv4.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/http.hpp"
#include <string>

struct S3Options {
    std::string bucket;
    std::string region{"us-east-1"};
    std::string endpoint; // empty: https://s3.<region>.amazonaws.com
    SigV4Credentials credentials;
    long timeout_ms{60000};
};

// S3-compatible store over libcurl, path-style addressing, SigV4 signed.
// Content hashes travel as x-amz-meta-sha256 so HEAD can answer whether a
// key already holds the same bytes.
class S3Store : public ObjectStore {
public:
    S3Store(HttpTransport& transport, S3Options opts);

    std::string name() const override { return "s3"; }
    std::optional<ObjectInfo> head(const std::string& key, const CancelToken& cancel) override;
    void write(const std::string& key, const std::string& bytes, const std::string& content_type,
               const std::string& sha256, const CancelToken& cancel) override;
    std::optional<StoredObject> read(const std::string& key, const CancelToken& cancel) override;
    std::string url_for(const std::string& key) const override;
    std::string presign_get(const std::string& key, std::chrono::seconds ttl) const override;

private:
    std::string canonical_uri(const std::string& key) const;
    HttpResponse send_signed(const std::string& method, const std::string& key, const std::string& body,
                             const std::string& payload_hash,
                             std::vector<std::pair<std::string, std::string>> extra_headers,
                             const CancelToken& cancel);

    HttpTransport& transport_;
    S3Options opts_;
    std::string host_;   // authority used in the signed host header
    std::string origin_; // scheme://host
};

// Maps an S3 error status onto the storage error kinds.
ErrorKind classify_s3_status(long status);
