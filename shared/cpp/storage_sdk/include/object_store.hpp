#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

class CancelToken;

struct ObjectInfo {
    std::string content_type;
    std::string sha256; // hex digest of the bytes, empty if the store does not know it
    std::size_t size{0};
};

struct StoredObject {
    ObjectInfo info;
    std::string bytes;
};

// Raw object store backend. Implementations throw StorageError with kind
// Unauthorized, Transient or Unexpected, and must be safe for concurrent use.
// write() never replaces an existing key: it throws kind Conflict instead.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::string name() const = 0;

    // nullopt when the key does not exist.
    virtual std::optional<ObjectInfo> head(const std::string& key, const CancelToken& cancel) = 0;
    virtual void write(const std::string& key, const std::string& bytes, const std::string& content_type,
                       const std::string& sha256, const CancelToken& cancel) = 0;
    virtual std::optional<StoredObject> read(const std::string& key, const CancelToken& cancel) = 0;

    virtual std::string url_for(const std::string& key) const = 0;
    // Time-limited GET link; stores without signing hand out url_for(key).
    virtual std::string presign_get(const std::string& key, std::chrono::seconds ttl) const {
        (void)ttl;
        return url_for(key);
    }
};
