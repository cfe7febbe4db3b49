#pragma once
#include "backend_client.hpp"
#include "generation_request.hpp"
#include "stage_result.hpp"

struct ThreeDParams {
    std::string model_id{"tencent/hunyuan3d-2"};
    std::size_t max_prompt_chars{4000};
    std::size_t max_image_bytes{20u * 1024u * 1024u};
};

// Image handed to the 3D stage: the storage key of an already persisted
// image, which the service fetches itself, or the bytes inline. Both empty
// for a text-only request; the key wins when both are set.
struct ImageInput {
    std::string storage_key;
    const Artifact* bytes{nullptr};

    bool empty() const { return storage_key.empty() && !bytes; }
};

// 3D stage.
//   POST {base}/generate-3d/  {"prompt", "model_id", "image_s3_key"?,
//                              "image_base64"?, "image_content_type"?, shape...}
//   -> mesh bytes, or {"model_url": ...} which is then downloaded (http(s) only).
class ThreeDClient : public BackendClient {
public:
    ThreeDClient(HttpTransport& transport, BackendOptions opts, ThreeDParams params = {});

    StageResult invoke(const std::string& prompt, const ImageInput& image, const ShapeParams& shape,
                       const CancelToken& cancel);

private:
    ThreeDParams params_;
};

// Extension for a downloaded mesh: taken from the URL path when it has one,
// otherwise from the content type, ".glb" by default.
std::string mesh_extension(const std::string& url, const std::string& content_type);
