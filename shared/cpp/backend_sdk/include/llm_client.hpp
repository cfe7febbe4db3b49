#pragma once
#include "backend_client.hpp"
#include "generation_request.hpp"
#include "stage_result.hpp"

// Text stage: expands the seed prompt into a structured asset description.
//   POST {base}/expand-prompt/  {"prompt": ..., "style": ...}
//   -> {"expanded_prompt": ..., "style_keywords": [...], ...}
class LlmClient : public BackendClient {
public:
    LlmClient(HttpTransport& transport, BackendOptions opts, std::size_t max_prompt_chars = 2000);

    StageResult invoke(const GenerationRequest& req, const CancelToken& cancel);

private:
    std::size_t max_prompt_chars_;
};
