#pragma once
#include "backend_client.hpp"
#include "stage_result.hpp"

struct ImageParams {
    int inference_steps{2};
    double guidance_scale{7.0};
};

// Image stage: renders the expanded prompt.
//   POST {base}/generate-image/  {"prompt", "num_inference_steps", "guidance_scale"}
//   -> image bytes (image/*)
class ImageClient : public BackendClient {
public:
    ImageClient(HttpTransport& transport, BackendOptions opts, ImageParams params = {},
                std::size_t max_prompt_chars = 4000);

    StageResult invoke(const std::string& prompt, const CancelToken& cancel);

private:
    ImageParams params_;
    std::size_t max_prompt_chars_;
};
