#include "../include/image_client.hpp"
#include "../../common/include/util.hpp"
#include <chrono>

using json = nlohmann::json;

namespace {
const std::string kPngSignature("\x89PNG\r\n\x1a\n", 8);
}

ImageClient::ImageClient(HttpTransport& transport, BackendOptions opts, ImageParams params,
                         std::size_t max_prompt_chars)
    : BackendClient("image", transport, std::move(opts)), params_(params), max_prompt_chars_(max_prompt_chars) {}

StageResult ImageClient::invoke(const std::string& prompt, const CancelToken& cancel) {
    auto started = std::chrono::steady_clock::now();
    if (trim(prompt).empty()) {
        return StageResult::failure(StageName::Image, {ErrorKind::Validation, "image prompt is empty", false});
    }
    if (utf8_length(prompt) > max_prompt_chars_) {
        return StageResult::failure(StageName::Image, {ErrorKind::Validation,
            "image prompt exceeds " + std::to_string(max_prompt_chars_) + " characters", false});
    }

    json body = {
        {"prompt", prompt},
        {"num_inference_steps", params_.inference_steps},
        {"guidance_scale", params_.guidance_scale}
    };
    auto r = post_json("/generate-image/", body, cancel);
    StageMetadata meta;
    meta.attempts = r.attempts;
    meta.elapsed_ms = elapsed_ms(started);
    if (!r.value) return StageResult::failure(StageName::Image, r.failure, meta);

    HttpResponse& resp = *r.value;
    std::string ctype = base_media_type(resp.content_type);
    if (!starts_with(ctype, "image/")) {
        return StageResult::failure(StageName::Image, {ErrorKind::Unexpected,
            "image service returned content type '" + resp.content_type + "'", false}, meta);
    }
    if (resp.body.empty()) {
        return StageResult::failure(StageName::Image, {ErrorKind::Unexpected, "image service returned an empty body", false}, meta);
    }
    if (ctype == "image/png" && resp.body.compare(0, kPngSignature.size(), kPngSignature) != 0) {
        return StageResult::failure(StageName::Image, {ErrorKind::Unexpected, "image body is not a PNG", false}, meta);
    }

    meta.details["content_type"] = ctype;
    meta.details["bytes"] = resp.body.size();
    StageSuccess s;
    s.artifact = Artifact("", ctype, std::move(resp.body));
    return StageResult::success(StageName::Image, std::move(s), std::move(meta));
}
