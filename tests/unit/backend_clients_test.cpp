#include "../../shared/cpp/backend_sdk/include/image_client.hpp"
#include "../../shared/cpp/backend_sdk/include/llm_client.hpp"
#include "../../shared/cpp/backend_sdk/include/threed_client.hpp"
#include "../../shared/cpp/common/include/util.hpp"
#include "test_fakes.hpp"

#include <cassert>
#include <iostream>
#include <nlohmann/json.hpp>

namespace {

using json = nlohmann::json;

BackendOptions Options(const std::string& base) {
    BackendOptions o;
    o.base_url = base;
    o.timeout_ms = 1000;
    o.retry.max_attempts = 3;
    o.retry.base_delay = std::chrono::milliseconds(1);
    o.retry.max_delay = std::chrono::milliseconds(2);
    o.retry.jitter = 0.0;
    return o;
}

GenerationRequest Request(const std::string& prompt) {
    GenerationRequest r;
    r.prompt = prompt;
    return r;
}

HttpResponse LlmOk() {
    json body = {
        {"expanded_prompt", "A glossy red cube with bevelled edges"},
        {"style_keywords", {"glossy", "minimal"}},
        {"primary_colors", {"red"}},
        {"materials", {"plastic"}},
        {"key_features", {"bevelled edges"}}
    };
    return FakeTransport::respond(200, body.dump());
}

void TestLlmSuccessCarriesTextAndSpec() {
    FakeTransport t;
    t.route("/expand-prompt/", [](const HttpRequest& req, const CancelToken*) {
        auto j = json::parse(req.body);
        assert(j["prompt"] == "a red cube");
        assert(j["style"] == "low-poly");
        return LlmOk();
    });
    auto opts = Options("http://llm.test/");
    opts.api_key = "secret";
    LlmClient llm(t, opts);
    GenerationRequest req = Request("a red cube");
    req.style = std::string("low-poly");
    CancelToken cancel;

    auto r = llm.invoke(req, cancel);
    assert(r.ok());
    assert(r.stage() == StageName::Llm);
    assert(r.value().text == "A glossy red cube with bevelled edges");
    assert(r.value().spec["materials"][0] == "plastic");
    assert(r.metadata().attempts == 1);

    auto calls = t.calls();
    assert(calls.size() == 1);
    assert(calls[0].url == "http://llm.test/expand-prompt/");
    assert(calls[0].method == "POST");
    bool has_key = false;
    for (const auto& h : calls[0].headers) has_key = has_key || h == "x-api-key: secret";
    assert(has_key);
}

void TestServerErrorsRetryUpToMaxAttempts() {
    FakeTransport t;
    t.route("/expand-prompt/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(503, "{\"detail\":\"warming up\"}");
    });
    LlmClient llm(t, Options("http://llm.test"));
    CancelToken cancel;

    auto r = llm.invoke(Request("a red cube"), cancel);
    assert(!r.ok());
    assert(r.error().kind == ErrorKind::Unavailable);
    assert(!r.error().retryable);
    assert(r.error().message.find("warming up") != std::string::npos);
    assert(t.calls_to("/expand-prompt/") == 3);
    assert(r.metadata().attempts == 3);
}

void TestClientErrorIsNotRetried() {
    FakeTransport t;
    t.route("/expand-prompt/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(400, "{\"detail\":\"prompt rejected\"}");
    });
    LlmClient llm(t, Options("http://llm.test"));
    CancelToken cancel;

    auto r = llm.invoke(Request("a red cube"), cancel);
    assert(r.error().kind == ErrorKind::Validation);
    assert(r.error().message.find("prompt rejected") != std::string::npos);
    assert(t.calls_to("/expand-prompt/") == 1);
}

void TestUnauthorizedIsNotRetried() {
    FakeTransport t;
    t.route("/expand-prompt/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(401, "{\"error\":\"bad key\"}");
    });
    LlmClient llm(t, Options("http://llm.test"));
    CancelToken cancel;

    auto r = llm.invoke(Request("a red cube"), cancel);
    assert(r.error().kind == ErrorKind::Unauthorized);
    assert(t.calls_to("/expand-prompt/") == 1);
}

void TestLocalValidationMakesNoCalls() {
    FakeTransport t;
    t.route("/", [](const HttpRequest&, const CancelToken*) { return LlmOk(); });
    LlmClient llm(t, Options("http://llm.test"), 10);
    CancelToken cancel;

    auto empty = llm.invoke(Request("   "), cancel);
    assert(empty.error().kind == ErrorKind::Validation);
    auto long_prompt = llm.invoke(Request("this prompt is longer than ten"), cancel);
    assert(long_prompt.error().kind == ErrorKind::Validation);

    ImageClient image(t, Options("http://image.test"));
    assert(image.invoke("", cancel).error().kind == ErrorKind::Validation);

    ThreeDParams params;
    params.max_image_bytes = 4;
    ThreeDClient threed(t, Options("http://threed.test"), params);
    Artifact big("", "image/png", "0123456789");
    assert(threed.invoke("cube", ImageInput{"", &big}, {}, cancel).error().kind == ErrorKind::Validation);
    Artifact empty_image("", "image/png", "");
    assert(threed.invoke("cube", ImageInput{"", &empty_image}, {}, cancel).error().kind == ErrorKind::Validation);

    assert(t.calls().empty());
}

void TestMalformedLlmBodyIsUnexpected() {
    FakeTransport t;
    int n = 0;
    t.route("/expand-prompt/", [&n](const HttpRequest&, const CancelToken*) {
        ++n;
        if (n == 1) return FakeTransport::respond(200, "not json at all");
        return FakeTransport::respond(200, "{\"style_keywords\":[]}");
    });
    LlmClient llm(t, Options("http://llm.test"));
    CancelToken cancel;

    assert(llm.invoke(Request("a red cube"), cancel).error().kind == ErrorKind::Unexpected);
    assert(llm.invoke(Request("a red cube"), cancel).error().kind == ErrorKind::Unexpected);
    assert(t.calls_to("/expand-prompt/") == 2);
}

void TestConnectFailuresAreRetried() {
    FakeTransport t;
    int n = 0;
    t.route("/expand-prompt/", [&n](const HttpRequest&, const CancelToken*) -> HttpResponse {
        if (++n < 3) throw TransportError(TransportFailure::ConnectFailed, "connection refused");
        return LlmOk();
    });
    LlmClient llm(t, Options("http://llm.test"));
    CancelToken cancel;

    auto r = llm.invoke(Request("a red cube"), cancel);
    assert(r.ok());
    assert(r.metadata().attempts == 3);
}

void TestImageClientAcceptsPng() {
    FakeTransport t;
    t.route("/generate-image/", [](const HttpRequest& req, const CancelToken*) {
        auto j = json::parse(req.body);
        assert(j["prompt"] == "A glossy red cube");
        assert(j["num_inference_steps"] == 4);
        assert(j["guidance_scale"] == 6.5);
        return FakeTransport::respond(200, fake_png(), "image/png");
    });
    ImageParams params;
    params.inference_steps = 4;
    params.guidance_scale = 6.5;
    ImageClient image(t, Options("http://image.test"), params);
    CancelToken cancel;

    auto r = image.invoke("A glossy red cube", cancel);
    assert(r.ok());
    assert(r.value().artifact);
    assert(r.value().artifact->content_type == "image/png");
    assert(r.value().artifact->bytes == fake_png());
    assert(r.metadata().details["bytes"] == fake_png().size());
}

void TestImageClientRejectsWrongPayloads() {
    FakeTransport t;
    int n = 0;
    t.route("/generate-image/", [&n](const HttpRequest&, const CancelToken*) {
        ++n;
        if (n == 1) return FakeTransport::respond(200, "{\"ok\":true}");
        if (n == 2) return FakeTransport::respond(200, "GIF89a", "image/png");
        return FakeTransport::respond(200, "", "image/png");
    });
    ImageClient image(t, Options("http://image.test"));
    CancelToken cancel;

    assert(image.invoke("cube", cancel).error().kind == ErrorKind::Unexpected);
    assert(image.invoke("cube", cancel).error().kind == ErrorKind::Unexpected);
    assert(image.invoke("cube", cancel).error().kind == ErrorKind::Unexpected);
    assert(t.calls_to("/generate-image/") == 3);
}

void TestThreeDBinaryResponse() {
    FakeTransport t;
    t.route("/generate-3d/", [](const HttpRequest& req, const CancelToken*) {
        auto j = json::parse(req.body);
        assert(j["model_id"] == "tencent/hunyuan3d-2");
        assert(j["image_base64"] == base64_encode(fake_png()));
        assert(j["image_content_type"] == "image/png");
        assert(j["octree_resolution"] == 256);
        return FakeTransport::respond(200, fake_glb(), "model/gltf-binary");
    });
    ThreeDClient threed(t, Options("http://threed.test"));
    Artifact image("", "image/png", fake_png());
    ShapeParams shape;
    shape.octree_resolution = 256;
    CancelToken cancel;

    auto r = threed.invoke("A glossy red cube", ImageInput{"", &image}, shape, cancel);
    assert(r.ok());
    assert(r.value().artifact->bytes == fake_glb());
    assert(r.value().artifact->content_type == "model/gltf-binary");
    assert(r.metadata().details["extension"] == ".glb");
    assert(r.metadata().details["with_image"] == true);
}

void TestThreeDModelUrlIsDownloaded() {
    FakeTransport t;
    t.route("/generate-3d/", [](const HttpRequest& req, const CancelToken*) {
        auto j = json::parse(req.body);
        assert(!j.contains("image_base64"));
        assert(!j.contains("image_s3_key"));
        return FakeTransport::respond(200, "{\"model_url\":\"http://cdn.test/out/mesh.obj?sig=abc\"}");
    });
    t.route("cdn.test/out/mesh.obj", [](const HttpRequest& req, const CancelToken*) {
        assert(req.follow_redirects);
        return FakeTransport::respond(200, "v 0 0 0\n", "application/octet-stream");
    });
    ThreeDClient threed(t, Options("http://threed.test"));
    CancelToken cancel;

    auto r = threed.invoke("A glossy red cube", ImageInput{}, {}, cancel);
    assert(r.ok());
    assert(r.value().artifact->bytes == "v 0 0 0\n");
    assert(r.value().artifact->content_type == "model/obj");
    assert(r.metadata().details["extension"] == ".obj");
    assert(r.metadata().attempts == 2);
    assert(t.calls_to("cdn.test") == 1);
}

void TestThreeDFailedPredictionIsUnexpected() {
    FakeTransport t;
    t.route("/generate-3d/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(200, "{\"status\":\"failed\",\"error\":\"out of memory\"}");
    });
    ThreeDClient threed(t, Options("http://threed.test"));
    CancelToken cancel;

    auto r = threed.invoke("cube", ImageInput{}, {}, cancel);
    assert(r.error().kind == ErrorKind::Unexpected);
    assert(r.error().message.find("out of memory") != std::string::npos);
    assert(t.calls_to("/generate-3d/") == 1);
}

void TestThreeDSendsImageStorageKey() {
    FakeTransport t;
    t.route("/generate-3d/", [](const HttpRequest& req, const CancelToken*) {
        auto j = json::parse(req.body);
        assert(j["image_s3_key"] == "images/run1.png");
        assert(!j.contains("image_base64"));
        assert(!j.contains("image_content_type"));
        return FakeTransport::respond(200, fake_glb(), "model/gltf-binary");
    });
    ThreeDParams params;
    params.max_image_bytes = 4;
    ThreeDClient threed(t, Options("http://threed.test"), params);
    // the size limit applies to inline bytes only
    Artifact big("images/run1.png", "image/png", fake_png());
    CancelToken cancel;

    auto r = threed.invoke("A glossy red cube", ImageInput{"images/run1.png", &big}, {}, cancel);
    assert(r.ok());
    assert(r.metadata().details["with_image"] == true);
    assert(r.metadata().details["image_key"] == "images/run1.png");
    assert(t.calls_to("/generate-3d/") == 1);
}

void TestThreeDRejectsNonHttpModelUrl() {
    FakeTransport t;
    t.route("/generate-3d/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(200, "{\"model_url\":\"file:///etc/hostname\"}");
    });
    ThreeDClient threed(t, Options("http://threed.test"));
    CancelToken cancel;

    auto r = threed.invoke("cube", ImageInput{}, {}, cancel);
    assert(!r.ok());
    assert(r.error().kind == ErrorKind::Validation);
    assert(r.error().message.find("file:///etc/hostname") != std::string::npos);
    assert(t.calls().size() == 1);
    assert(t.calls_to("file://") == 0);

    FakeTransport ftp;
    ftp.route("/generate-3d/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(200, "{\"output\":[{\"url\":\"ftp://cdn.test/mesh.glb\"}]}");
    });
    ThreeDClient threed_ftp(ftp, Options("http://threed.test"));
    assert(threed_ftp.invoke("cube", ImageInput{}, {}, cancel).error().kind == ErrorKind::Validation);
    assert(ftp.calls_to("ftp://") == 0);
}

void TestApiKeyStaysWithTheConfiguredHost() {
    FakeTransport t;
    t.route("threed.test/generate-3d/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(200, "{\"model_url\":\"http://threed.test.attacker.example/m.glb\"}");
    });
    t.route("attacker.example/m.glb", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(200, fake_glb(), "model/gltf-binary");
    });
    auto opts = Options("http://threed.test");
    opts.api_key = "secret";
    ThreeDClient threed(t, opts);
    CancelToken cancel;

    auto r = threed.invoke("cube", ImageInput{}, {}, cancel);
    assert(r.ok());
    auto has_key = [](const HttpRequest& req) {
        for (const auto& h : req.headers) {
            if (h == "x-api-key: secret") return true;
        }
        return false;
    };
    auto calls = t.calls();
    assert(calls.size() == 2);
    assert(calls[0].url == "http://threed.test/generate-3d/");
    assert(has_key(calls[0]));
    assert(calls[1].url == "http://threed.test.attacker.example/m.glb");
    assert(!has_key(calls[1]));
}

void TestUrlHelpers() {
    assert(is_http_url("http://cdn.test/a.glb"));
    assert(is_http_url("HTTPS://cdn.test"));
    assert(!is_http_url("file:///etc/hostname"));
    assert(!is_http_url("ftp://cdn.test/a.glb"));
    assert(!is_http_url("http:///a.glb"));
    assert(!is_http_url("http://"));
    assert(!is_http_url("cdn.test/a.glb"));

    assert(url_origin("http://threed.test/generate-3d/") == "http://threed.test");
    assert(url_origin("http://threed.test:80/x") == "http://threed.test");
    assert(url_origin("https://Threed.Test:443?x=1") == "https://threed.test");
    assert(url_origin("http://threed.test:8080/x") == "http://threed.test:8080");
    assert(url_origin("http://user@threed.test/x") == "http://threed.test");
    assert(url_origin("http://threed.test.attacker.example/m.glb") != url_origin("http://threed.test"));
    assert(url_origin("https://threed.test/") != url_origin("http://threed.test/"));
    assert(url_origin("threed.test/x").empty());
}

void TestPromptLimitsCountCharacters() {
    // U+732B, three bytes in UTF-8
    std::string cat;
    for (int i = 0; i < 10; ++i) cat += "\xe7\x8c\xab";
    assert(cat.size() == 30);
    assert(utf8_length(cat) == 10);
    assert(utf8_length("caf\xc3\xa9") == 4);
    assert(utf8_length("") == 0);

    assert(!validate_request(Request(cat), 10));
    assert(validate_request(Request(cat + "\xe7\x8c\xab"), 10));
    GenerationRequest styled = Request("cube");
    styled.style = cat;
    assert(!validate_request(styled, 10));

    FakeTransport t;
    t.route("/expand-prompt/", [](const HttpRequest&, const CancelToken*) { return LlmOk(); });
    t.route("/generate-image/", [](const HttpRequest&, const CancelToken*) {
        return FakeTransport::respond(200, fake_png(), "image/png");
    });
    LlmClient llm(t, Options("http://llm.test"), 10);
    CancelToken cancel;
    assert(llm.invoke(Request(cat), cancel).ok());
    assert(llm.invoke(Request(cat + "x"), cancel).error().kind == ErrorKind::Validation);
    assert(t.calls_to("/expand-prompt/") == 1);

    ImageClient image(t, Options("http://image.test"), ImageParams{}, 10);
    assert(image.invoke(cat, cancel).ok());
    assert(image.invoke(cat + "x", cancel).error().kind == ErrorKind::Validation);
    assert(t.calls_to("/generate-image/") == 1);
}

void TestMeshExtension() {
    assert(mesh_extension("https://cdn.test/a/b/model.GLB?x=1", "") == ".glb");
    assert(mesh_extension("https://cdn.test/a/b/model.obj", "model/gltf-binary") == ".obj");
    assert(mesh_extension("https://cdn.test/a/b/model", "model/obj") == ".obj");
    assert(mesh_extension("https://cdn.test.example/download", "application/octet-stream") == ".glb");
    assert(mesh_extension("", "model/gltf+json") == ".gltf");
}

} // namespace

int main() {
    TestLlmSuccessCarriesTextAndSpec();
    TestServerErrorsRetryUpToMaxAttempts();
    TestClientErrorIsNotRetried();
    TestUnauthorizedIsNotRetried();
    TestLocalValidationMakesNoCalls();
    TestMalformedLlmBodyIsUnexpected();
    TestConnectFailuresAreRetried();
    TestImageClientAcceptsPng();
    TestImageClientRejectsWrongPayloads();
    TestThreeDBinaryResponse();
    TestThreeDModelUrlIsDownloaded();
    TestThreeDFailedPredictionIsUnexpected();
    TestThreeDSendsImageStorageKey();
    TestThreeDRejectsNonHttpModelUrl();
    TestApiKeyStaysWithTheConfiguredHost();
    TestUrlHelpers();
    TestPromptLimitsCountCharacters();
    TestMeshExtension();

    std::cout << "assetgen_unit_backend_clients: pass\n";
    return 0;
}
