#pragma once
#include "object_store.hpp"
#include "../../common/include/artifact.hpp"
#include "../../common/include/retry.hpp"
#include <chrono>
#include <string>

// put/get of artifacts over an ObjectStore. Holds no state besides the store
// handle, so one instance serves every run.
class StorageClient {
public:
    StorageClient(ObjectStore& store, RetryPolicy retry);

    // Consumes the artifact. Writes without reading first, so a store that
    // refuses HEAD on missing keys still accepts new objects. Idempotent per
    // key: when the key already holds
    // the same bytes the existing Reference is returned, different bytes
    // fail with Conflict.
    Retried<Reference> put(Artifact artifact, const CancelToken& cancel);

    // A missing key is reported as Unexpected.
    Retried<Artifact> get(const std::string& key, const CancelToken& cancel);
    Retried<Artifact> get(const Reference& ref, const CancelToken& cancel) { return get(ref.key, cancel); }

    std::string presign(const std::string& key, std::chrono::seconds ttl) const;

private:
    Reference reference_for(const std::string& key) const;
    Attempt<Reference> compare_existing(const std::string& key, const std::string& sha256,
                                        const ObjectInfo& existing) const;

    ObjectStore& store_;
    RetryPolicy retry_;
};
