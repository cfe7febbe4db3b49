#include "../include/llm_client.hpp"
#include "../../common/include/util.hpp"
#include <chrono>

using json = nlohmann::json;

LlmClient::LlmClient(HttpTransport& transport, BackendOptions opts, std::size_t max_prompt_chars)
    : BackendClient("llm", transport, std::move(opts)), max_prompt_chars_(max_prompt_chars) {}

StageResult LlmClient::invoke(const GenerationRequest& req, const CancelToken& cancel) {
    auto started = std::chrono::steady_clock::now();
    if (trim(req.prompt).empty()) {
        return StageResult::failure(StageName::Llm, {ErrorKind::Validation, "prompt is empty", false});
    }
    if (utf8_length(req.prompt) > max_prompt_chars_) {
        return StageResult::failure(StageName::Llm, {ErrorKind::Validation,
            "prompt exceeds " + std::to_string(max_prompt_chars_) + " characters", false});
    }

    json body = {{"prompt", req.prompt}};
    if (req.style && !req.style->empty()) body["style"] = *req.style;

    auto r = post_json("/expand-prompt/", body, cancel);
    StageMetadata meta;
    meta.attempts = r.attempts;
    meta.elapsed_ms = elapsed_ms(started);
    if (!r.value) return StageResult::failure(StageName::Llm, r.failure, meta);

    auto spec = json::parse(r.value->body, nullptr, false);
    if (spec.is_discarded() || !spec.is_object()) {
        return StageResult::failure(StageName::Llm, {ErrorKind::Unexpected, "llm response is not a JSON object", false}, meta);
    }
    auto it = spec.find("expanded_prompt");
    if (it == spec.end() || !it->is_string() || trim(it->get<std::string>()).empty()) {
        return StageResult::failure(StageName::Llm, {ErrorKind::Unexpected, "llm response lacks expanded_prompt", false}, meta);
    }

    StageSuccess s;
    s.text = it->get<std::string>();
    s.spec = std::move(spec);
    meta.details["chars"] = s.text.size();
    return StageResult::success(StageName::Llm, std::move(s), std::move(meta));
}
