#include "../include/threed_client.hpp"
#include "../../common/include/util.hpp"
#include <chrono>

using json = nlohmann::json;

namespace {
bool is_mesh_type(const std::string& t) {
    return starts_with(t, "model/") || t == "application/octet-stream";
}

std::string mesh_content_type(const std::string& ctype, const std::string& ext) {
    if (starts_with(ctype, "model/")) return ctype;
    if (ext == ".glb") return "model/gltf-binary";
    if (ext == ".obj") return "model/obj";
    if (ext == ".gltf") return "model/gltf+json";
    return "application/octet-stream";
}

// The 3D service answers with {"model_url": ...}; prediction-style bodies
// carry the link under "output" as a string, {"url"}, or a list of either.
std::optional<std::string> model_url_from(const json& j) {
    auto as_url = [](const json& v) -> std::optional<std::string> {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_object() && v.contains("url") && v["url"].is_string()) return v["url"].get<std::string>();
        return std::nullopt;
    };
    if (j.contains("model_url") && j["model_url"].is_string()) return j["model_url"].get<std::string>();
    if (!j.contains("output")) return std::nullopt;
    const auto& out = j["output"];
    if (out.is_array()) {
        if (out.empty()) return std::nullopt;
        return as_url(out.front());
    }
    return as_url(out);
}
}

std::string mesh_extension(const std::string& url, const std::string& content_type) {
    std::string path;
    auto scheme = url.find("://");
    auto path_start = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path_start != std::string::npos) {
        path = url.substr(path_start);
        path = path.substr(0, path.find_first_of("?#"));
    }
    auto file = path.substr(path.rfind('/') == std::string::npos ? 0 : path.rfind('/') + 1);
    auto dot = file.rfind('.');
    if (dot != std::string::npos && dot + 1 < file.size()) return to_lower(file.substr(dot));

    auto t = base_media_type(content_type);
    if (t == "model/obj") return ".obj";
    if (t == "model/gltf+json" || t == "model/vnd.gltf+json") return ".gltf";
    return ".glb";
}

ThreeDClient::ThreeDClient(HttpTransport& transport, BackendOptions opts, ThreeDParams params)
    : BackendClient("threed", transport, std::move(opts)), params_(std::move(params)) {}

StageResult ThreeDClient::invoke(const std::string& prompt, const ImageInput& image, const ShapeParams& shape,
                                 const CancelToken& cancel) {
    auto started = std::chrono::steady_clock::now();
    if (trim(prompt).empty()) {
        return StageResult::failure(StageName::ThreeD, {ErrorKind::Validation, "3d prompt is empty", false});
    }
    if (utf8_length(prompt) > params_.max_prompt_chars) {
        return StageResult::failure(StageName::ThreeD, {ErrorKind::Validation,
            "3d prompt exceeds " + std::to_string(params_.max_prompt_chars) + " characters", false});
    }
    const bool inline_image = image.storage_key.empty() && image.bytes;
    if (inline_image && image.bytes->bytes.empty()) {
        return StageResult::failure(StageName::ThreeD, {ErrorKind::Validation, "input image is empty", false});
    }
    if (inline_image && image.bytes->bytes.size() > params_.max_image_bytes) {
        return StageResult::failure(StageName::ThreeD, {ErrorKind::Validation,
            "input image exceeds " + std::to_string(params_.max_image_bytes) + " bytes", false});
    }

    json body = {{"prompt", prompt}, {"model_id", params_.model_id}};
    if (!image.storage_key.empty()) {
        body["image_s3_key"] = image.storage_key;
    } else if (inline_image) {
        body["image_base64"] = base64_encode(image.bytes->bytes);
        body["image_content_type"] = image.bytes->content_type;
    }
    if (shape.octree_resolution) body["octree_resolution"] = *shape.octree_resolution;
    if (shape.face_count) body["face_count"] = *shape.face_count;
    if (shape.texture) body["texture"] = *shape.texture;

    auto r = post_json("/generate-3d/", body, cancel);
    StageMetadata meta;
    meta.attempts = r.attempts;
    meta.details["model_id"] = params_.model_id;
    meta.details["with_image"] = !image.empty();
    if (!image.storage_key.empty()) meta.details["image_key"] = image.storage_key;
    if (!r.value) {
        meta.elapsed_ms = elapsed_ms(started);
        return StageResult::failure(StageName::ThreeD, r.failure, meta);
    }

    std::string ctype = base_media_type(r.value->content_type);
    std::string bytes;
    std::string ext;
    if (ctype == "application/json") {
        auto j = json::parse(r.value->body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            meta.elapsed_ms = elapsed_ms(started);
            return StageResult::failure(StageName::ThreeD, {ErrorKind::Unexpected, "3d response is not a JSON object", false}, meta);
        }
        std::string status = j.value("status", std::string());
        if (status == "failed" || status == "canceled") {
            meta.elapsed_ms = elapsed_ms(started);
            return StageResult::failure(StageName::ThreeD, {ErrorKind::Unexpected,
                "3d generation " + status + ": " + error_detail(*r.value), false}, meta);
        }
        auto url = model_url_from(j);
        if (!url) {
            meta.elapsed_ms = elapsed_ms(started);
            return StageResult::failure(StageName::ThreeD, {ErrorKind::Unexpected, "3d response has no model url", false}, meta);
        }
        if (!is_http_url(*url)) {
            meta.elapsed_ms = elapsed_ms(started);
            return StageResult::failure(StageName::ThreeD, {ErrorKind::Validation,
                "3d model url is not http(s): " + url->substr(0, 200), false}, meta);
        }
        auto d = get_url(*url, cancel);
        meta.attempts += d.attempts;
        meta.details["model_url"] = *url;
        if (!d.value) {
            meta.elapsed_ms = elapsed_ms(started);
            return StageResult::failure(StageName::ThreeD, d.failure, meta);
        }
        ctype = base_media_type(d.value->content_type);
        ext = mesh_extension(*url, ctype);
        bytes = std::move(d.value->body);
    } else if (is_mesh_type(ctype)) {
        ext = mesh_extension("", ctype);
        bytes = std::move(r.value->body);
    } else {
        meta.elapsed_ms = elapsed_ms(started);
        return StageResult::failure(StageName::ThreeD, {ErrorKind::Unexpected,
            "3d service returned content type '" + r.value->content_type + "'", false}, meta);
    }

    meta.elapsed_ms = elapsed_ms(started);
    if (bytes.empty()) {
        return StageResult::failure(StageName::ThreeD, {ErrorKind::Unexpected, "3d model body is empty", false}, meta);
    }
    ctype = mesh_content_type(ctype, ext);
    meta.details["content_type"] = ctype;
    meta.details["extension"] = ext;
    meta.details["bytes"] = bytes.size();
    StageSuccess s;
    s.artifact = Artifact("", ctype, std::move(bytes));
    return StageResult::success(StageName::ThreeD, std::move(s), std::move(meta));
}
