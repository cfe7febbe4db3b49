#include "../../shared/cpp/common/include/util.hpp"
#include "../../shared/cpp/storage_sdk/include/s3_store.hpp"
#include "../../shared/cpp/storage_sdk/include/storage_client.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <iostream>
#include <map>

namespace {

S3Options TestOptions() {
    S3Options o;
    o.bucket = "assets";
    o.region = "eu-west-1";
    o.endpoint = "http://s3.test/";
    o.credentials.access_key_id = "AKIDEXAMPLE";
    o.credentials.secret_access_key = "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY";
    return o;
}

RetryPolicy FastPolicy() {
    RetryPolicy p;
    p.max_attempts = 3;
    p.base_delay = std::chrono::milliseconds(1);
    p.max_delay = std::chrono::milliseconds(2);
    p.jitter = 0.0;
    return p;
}

// Value of the request header `name`, empty when absent.
std::string RequestHeader(const HttpRequest& req, const std::string& name) {
    const std::string prefix = to_lower(name) + ":";
    for (const auto& h : req.headers) {
        if (to_lower(h.substr(0, prefix.size())) == prefix) return trim(h.substr(prefix.size()));
    }
    return {};
}

// Minimal bucket behind FakeTransport: conditional PUT, HEAD and GET with
// the content hash kept as user metadata.
struct FakeBucket {
    struct Object {
        std::string body;
        std::string content_type;
        std::string sha256;
    };
    std::map<std::string, Object> objects;
    bool forbid_head{false};

    HttpResponse handle(const HttpRequest& req) {
        const std::string path = req.url.substr(std::string("http://s3.test").size());
        auto it = objects.find(path);
        if (req.method == "PUT") {
            if (it != objects.end() && RequestHeader(req, "if-none-match") == "*") {
                return FakeTransport::respond(412, "<Error><Code>PreconditionFailed</Code></Error>", "application/xml");
            }
            objects[path] = Object{req.body, RequestHeader(req, "content-type"), RequestHeader(req, "x-amz-meta-sha256")};
            return FakeTransport::respond(200, "");
        }
        if (req.method == "HEAD" && forbid_head) {
            // S3 answers 403 instead of 404 without s3:ListBucket
            return FakeTransport::respond(403, "", "application/xml");
        }
        if (it == objects.end()) {
            return FakeTransport::respond(404, "<Error><Code>NoSuchKey</Code></Error>", "application/xml");
        }
        auto resp = FakeTransport::respond(200, req.method == "GET" ? it->second.body : "", it->second.content_type);
        resp.headers["x-amz-meta-sha256"] = it->second.sha256;
        resp.headers["content-length"] = std::to_string(it->second.body.size());
        return resp;
    }
};

void Serve(FakeTransport& transport, FakeBucket& bucket) {
    transport.route("s3.test/", [&bucket](const HttpRequest& req, const CancelToken*) { return bucket.handle(req); });
}

void TestPutIsSignedAndConditional() {
    FakeTransport transport;
    FakeBucket bucket;
    Serve(transport, bucket);
    S3Store s3(transport, TestOptions());
    CancelToken cancel;

    const std::string sha = sha256_hex(fake_png());
    s3.write("images/run 1.png", fake_png(), "image/png", sha, cancel);

    auto calls = transport.calls();
    assert(calls.size() == 1);
    const auto& put = calls[0];
    assert(put.method == "PUT");
    assert(put.url == "http://s3.test/assets/images/run%201.png");
    assert(put.body == fake_png());

    const std::string auth = RequestHeader(put, "authorization");
    assert(auth.rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/", 0) == 0);
    assert(auth.find("/eu-west-1/s3/aws4_request") != std::string::npos);
    assert(auth.find("SignedHeaders=content-type;host;if-none-match;x-amz-content-sha256;x-amz-date;x-amz-meta-sha256") !=
           std::string::npos);
    assert(auth.find("Signature=") != std::string::npos);
    assert(RequestHeader(put, "x-amz-content-sha256") == sha);
    assert(RequestHeader(put, "x-amz-meta-sha256") == sha);
    assert(RequestHeader(put, "if-none-match") == "*");
    assert(RequestHeader(put, "x-amz-date").size() == 16);
    assert(RequestHeader(put, "host").empty());
    assert(RequestHeader(put, "x-amz-security-token").empty());
}

void TestSessionTokenIsSent() {
    FakeTransport transport;
    FakeBucket bucket;
    Serve(transport, bucket);
    auto opts = TestOptions();
    opts.credentials.session_token = "session-123";
    S3Store s3(transport, opts);
    CancelToken cancel;

    assert(!s3.head("images/a.png", cancel));
    const auto req = transport.calls().at(0);
    assert(RequestHeader(req, "x-amz-security-token") == "session-123");
    assert(RequestHeader(req, "authorization").find("x-amz-security-token") != std::string::npos);
}

void TestTakenKeyIsConflict() {
    FakeTransport transport;
    FakeBucket bucket;
    Serve(transport, bucket);
    S3Store s3(transport, TestOptions());
    CancelToken cancel;

    s3.write("models/run1.glb", "mesh-a", "model/gltf-binary", sha256_hex("mesh-a"), cancel);
    bool threw = false;
    try {
        s3.write("models/run1.glb", "mesh-b", "model/gltf-binary", sha256_hex("mesh-b"), cancel);
    } catch (const StorageError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::Conflict);
        assert(std::string(e.what()).find("412 PreconditionFailed") != std::string::npos);
    }
    assert(threw);
    assert(bucket.objects["/assets/models/run1.glb"].body == "mesh-a");
}

void TestHeadAndGetCarryTheContentHash() {
    FakeTransport transport;
    FakeBucket bucket;
    Serve(transport, bucket);
    S3Store s3(transport, TestOptions());
    CancelToken cancel;

    assert(!s3.head("images/a.png", cancel));
    assert(!s3.read("images/a.png", cancel));

    const std::string sha = sha256_hex(fake_png());
    s3.write("images/a.png", fake_png(), "image/png", sha, cancel);

    auto info = s3.head("images/a.png", cancel);
    assert(info);
    assert(info->sha256 == sha);
    assert(info->size == fake_png().size());
    assert(info->content_type == "image/png");

    auto obj = s3.read("images/a.png", cancel);
    assert(obj);
    assert(obj->bytes == fake_png());
    assert(obj->info.sha256 == sha);
    assert(obj->info.content_type == "image/png");
}

void TestErrorStatusesMapToKinds() {
    assert(classify_s3_status(403) == ErrorKind::Unauthorized);
    assert(classify_s3_status(401) == ErrorKind::Unauthorized);
    assert(classify_s3_status(503) == ErrorKind::Transient);
    assert(classify_s3_status(500) == ErrorKind::Transient);
    assert(classify_s3_status(429) == ErrorKind::Transient);
    assert(classify_s3_status(400) == ErrorKind::Unexpected);

    FakeTransport transport;
    transport.route("s3.test/assets/busy", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(503, "<Error><Code>SlowDown</Code></Error>", "application/xml");
    });
    transport.route("s3.test/assets/denied", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(403, "<Error><Code>AccessDenied</Code></Error>", "application/xml");
    });
    transport.route("s3.test/assets/down", [](const HttpRequest&, const CancelToken*) -> HttpResponse {
        throw TransportError(TransportFailure::ConnectFailed, "connection refused");
    });
    S3Store s3(transport, TestOptions());
    CancelToken cancel;

    auto kind_of = [&](const std::string& key) {
        try {
            s3.write(key, "x", "text/plain", sha256_hex("x"), cancel);
        } catch (const StorageError& e) {
            return e.kind();
        }
        return ErrorKind::Validation;
    };
    assert(kind_of("busy") == ErrorKind::Transient);
    assert(kind_of("denied") == ErrorKind::Unauthorized);
    assert(kind_of("down") == ErrorKind::Transient);
}

void TestPutSucceedsWhenHeadIsForbidden() {
    FakeTransport transport;
    FakeBucket bucket;
    bucket.forbid_head = true;
    Serve(transport, bucket);
    S3Store s3(transport, TestOptions());
    StorageClient storage(s3, FastPolicy());
    CancelToken cancel;

    auto r = storage.put(Artifact("images/run9.png", "image/png", fake_png()), cancel);
    assert(r.value);
    assert(r.value->key == "images/run9.png");
    assert(r.value->url == "http://s3.test/assets/images/run9.png");
    assert(transport.calls().size() == 1);
    assert(transport.calls()[0].method == "PUT");
}

void TestRepeatedPutOfSameBytesIsAccepted() {
    FakeTransport transport;
    FakeBucket bucket;
    Serve(transport, bucket);
    S3Store s3(transport, TestOptions());
    StorageClient storage(s3, FastPolicy());
    CancelToken cancel;

    assert(storage.put(Artifact("images/run10.png", "image/png", fake_png()), cancel).value);
    auto again = storage.put(Artifact("images/run10.png", "image/png", fake_png()), cancel);
    assert(again.value);
    auto different = storage.put(Artifact("images/run10.png", "image/png", "other"), cancel);
    assert(!different.value);
    assert(different.failure.kind == ErrorKind::Conflict);

    auto got = storage.get("images/run10.png", cancel);
    assert(got.value && got.value->bytes == fake_png());
}

void TestPresignedUrl() {
    FakeTransport transport;
    S3Store s3(transport, TestOptions());
    auto url = s3.presign_get("models/run1.glb", std::chrono::seconds(600));
    assert(url.rfind("http://s3.test/assets/models/run1.glb?", 0) == 0);
    assert(url.find("X-Amz-Algorithm=AWS4-HMAC-SHA256") != std::string::npos);
    assert(url.find("X-Amz-Expires=600") != std::string::npos);
    assert(url.find("X-Amz-Signature=") != std::string::npos);
    assert(transport.calls().empty());
}

void TestMissingSettingsAreRejected() {
    FakeTransport transport;
    auto no_bucket = TestOptions();
    no_bucket.bucket.clear();
    auto no_secret = TestOptions();
    no_secret.credentials.secret_access_key.clear();
    auto no_scheme = TestOptions();
    no_scheme.endpoint = "s3.test";

    int rejected = 0;
    for (const auto& opts : {no_bucket, no_secret, no_scheme}) {
        try {
            S3Store s3(transport, opts);
        } catch (const ConfigError&) {
            ++rejected;
        }
    }
    assert(rejected == 3);
}

} // namespace

int main() {
    TestPutIsSignedAndConditional();
    TestSessionTokenIsSent();
    TestTakenKeyIsConflict();
    TestHeadAndGetCarryTheContentHash();
    TestErrorStatusesMapToKinds();
    TestPutSucceedsWhenHeadIsForbidden();
    TestRepeatedPutOfSameBytesIsAccepted();
    TestPresignedUrl();
    TestMissingSettingsAreRejected();

    std::cout << "assetgen_unit_s3_store: pass\n";
    return 0;
}
