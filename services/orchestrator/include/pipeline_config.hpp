#pragma once
#include "../../../shared/cpp/backend_sdk/include/stage_result.hpp"
#include "../../../shared/cpp/common/include/retry.hpp"
#include <cstddef>
#include <set>
#include <string>

enum class StorageBackend { S3, Sqlite };

const char* to_string(StorageBackend backend);

// How the image reaches the 3D service: by the storage key of the image,
// persisted as soon as it is generated, or inline as base64.
enum class ImageHandoff { StorageKey, Inline };

const char* to_string(ImageHandoff handoff);

// Built once at process start, then only read. Passed around by reference.
struct PipelineConfig {
    std::string llm_endpoint{"http://localhost:8000"};
    std::string image_endpoint{"http://localhost:8001"};
    std::string threed_endpoint{"http://localhost:8002"};
    std::string llm_api_key;
    std::string image_api_key;
    std::string threed_api_key;

    StorageBackend storage_backend{StorageBackend::S3};
    std::string storage_bucket;
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    std::string aws_session_token;
    std::string aws_region{"us-east-1"};
    std::string s3_endpoint;
    std::string sqlite_path{"./data/artifacts.db"};

    long llm_timeout_ms{30000};
    long image_timeout_ms{300000};
    long threed_timeout_ms{600000};
    long storage_timeout_ms{60000};
    long run_timeout_ms{0}; // 0: derived from the stage budgets

    int retry_max_attempts{3};
    long retry_base_delay_ms{500};
    long retry_max_delay_ms{8000};

    std::set<StageName> optional_stages;
    bool threed_without_image{false};
    ImageHandoff image_handoff{ImageHandoff::StorageKey};
    bool persist_metadata{true};
    long presign_ttl_s{0};

    int image_inference_steps{2};
    double image_guidance_scale{7.0};
    std::string threed_model_id{"tencent/hunyuan3d-2"};
    std::size_t max_prompt_chars{2000};
    std::size_t max_image_bytes{20u * 1024u * 1024u};

    int server_port{7860};
    int server_workers{4};
    std::size_t server_max_finished{256};

    RetryPolicy retry_policy() const;
    bool is_optional(StageName stage) const { return optional_stages.count(stage) > 0; }
};

// Reads every option from the environment; throws ConfigError on bad values.
PipelineConfig load_config_from_env();

// Checks cross-field rules (endpoints, credentials, stage policy).
void validate_config(const PipelineConfig& cfg);

// "image,threed" -> {Image, ThreeD}. "llm" or unknown names throw ConfigError.
std::set<StageName> parse_optional_stages(const std::string& csv);
