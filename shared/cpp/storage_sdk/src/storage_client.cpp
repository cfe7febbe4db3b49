#include "../include/storage_client.hpp"
#include "../../common/include/util.hpp"

StorageClient::StorageClient(ObjectStore& store, RetryPolicy retry) : store_(store), retry_(std::move(retry)) {}

Reference StorageClient::reference_for(const std::string& key) const {
    return Reference{key, store_.url_for(key)};
}

Attempt<Reference> StorageClient::compare_existing(const std::string& key, const std::string& sha256,
                                                   const ObjectInfo& existing) const {
    if (existing.sha256.empty()) {
        return Attempt<Reference>::fail(ErrorKind::Conflict, "key " + key + " exists without a content hash");
    }
    if (existing.sha256 != sha256) {
        return Attempt<Reference>::fail(ErrorKind::Conflict, "key " + key + " already holds different bytes");
    }
    log_info("storage", "already stored key=" + key);
    return Attempt<Reference>::ok(reference_for(key));
}

Retried<Reference> StorageClient::put(Artifact artifact, const CancelToken& cancel) {
    if (artifact.key.empty()) {
        Retried<Reference> out;
        out.failure = Failure{ErrorKind::Validation, "artifact has no storage key", false};
        return out;
    }
    if (artifact.content_type.empty()) artifact.content_type = "application/octet-stream";
    const Artifact held = std::move(artifact);
    const std::string sha = sha256_hex(held.bytes);

    return run_with_retry<Reference>(retry_, cancel, "storage", [&](int attempt) -> Attempt<Reference> {
        try {
            // conditional write first; the key is only inspected once it turns out to be taken
            try {
                store_.write(held.key, held.bytes, held.content_type, sha, cancel);
            } catch (const StorageError& e) {
                if (e.kind() != ErrorKind::Conflict) throw;
                auto existing = store_.head(held.key, cancel);
                if (!existing) throw;
                return compare_existing(held.key, sha, *existing);
            }
            log_info("storage", "put key=" + held.key + " bytes=" + std::to_string(held.bytes.size()) +
                                " backend=" + store_.name() + " attempt=" + std::to_string(attempt));
            return Attempt<Reference>::ok(reference_for(held.key));
        } catch (const StorageError& e) {
            return Attempt<Reference>::fail(e.kind(), e.what());
        } catch (const std::exception& e) {
            return Attempt<Reference>::fail(ErrorKind::Unexpected, std::string("put ") + held.key + ": " + e.what());
        }
    });
}

Retried<Artifact> StorageClient::get(const std::string& key, const CancelToken& cancel) {
    return run_with_retry<Artifact>(retry_, cancel, "storage", [&](int) -> Attempt<Artifact> {
        try {
            auto obj = store_.read(key, cancel);
            if (!obj) return Attempt<Artifact>::fail(ErrorKind::Unexpected, "not found: " + key);
            if (!obj->info.sha256.empty() && sha256_hex(obj->bytes) != obj->info.sha256) {
                return Attempt<Artifact>::fail(ErrorKind::Unexpected, "content hash mismatch for " + key);
            }
            return Attempt<Artifact>::ok(Artifact(key, obj->info.content_type, std::move(obj->bytes)));
        } catch (const StorageError& e) {
            return Attempt<Artifact>::fail(e.kind(), e.what());
        } catch (const std::exception& e) {
            return Attempt<Artifact>::fail(ErrorKind::Unexpected, std::string("get ") + key + ": " + e.what());
        }
    });
}

std::string StorageClient::presign(const std::string& key, std::chrono::seconds ttl) const {
    return store_.presign_get(key, ttl);
}
