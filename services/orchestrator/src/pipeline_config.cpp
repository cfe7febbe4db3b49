#include "../include/pipeline_config.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <cstdlib>

namespace {
std::string env_str(const char* name, const std::string& def) {
    std::string v = trim(getenv_or(name, ""));
    return v.empty() ? def : v;
}

long env_long(const char* name, long def, long min_v, long max_v) {
    const char* raw = std::getenv(name);
    if (!raw || trim(raw).empty()) return def;
    std::string v = trim(raw);
    std::size_t used = 0;
    long out = 0;
    try {
        out = std::stol(v, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not a number: " + v);
    }
    if (used != v.size()) throw ConfigError(std::string(name) + " is not a number: " + v);
    if (out < min_v || out > max_v) {
        throw ConfigError(std::string(name) + " must be within " + std::to_string(min_v) + ".." +
                          std::to_string(max_v) + ", got " + v);
    }
    return out;
}

double env_double(const char* name, double def, double min_v, double max_v) {
    const char* raw = std::getenv(name);
    if (!raw || trim(raw).empty()) return def;
    std::string v = trim(raw);
    std::size_t used = 0;
    double out = 0;
    try {
        out = std::stod(v, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " is not a number: " + v);
    }
    if (used != v.size() || out < min_v || out > max_v) {
        throw ConfigError(std::string(name) + " is out of range: " + v);
    }
    return out;
}

bool env_bool(const char* name, bool def) {
    const char* raw = std::getenv(name);
    if (!raw || trim(raw).empty()) return def;
    std::string v = to_lower(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(std::string(name) + " is not a boolean: " + raw);
}

void check_endpoint(const char* what, const std::string& url) {
    if (!starts_with(url, "http://") && !starts_with(url, "https://")) {
        throw ConfigError(std::string(what) + " must be an http(s) URL, got '" + url + "'");
    }
}
}

const char* to_string(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::S3: return "s3";
        case StorageBackend::Sqlite: return "sqlite";
    }
    return "unknown";
}

const char* to_string(ImageHandoff handoff) {
    switch (handoff) {
        case ImageHandoff::StorageKey: return "storage_key";
        case ImageHandoff::Inline: return "inline";
    }
    return "unknown";
}

RetryPolicy PipelineConfig::retry_policy() const {
    RetryPolicy p;
    p.max_attempts = retry_max_attempts;
    p.base_delay = std::chrono::milliseconds(retry_base_delay_ms);
    p.max_delay = std::chrono::milliseconds(retry_max_delay_ms);
    return p;
}

std::set<StageName> parse_optional_stages(const std::string& csv) {
    std::set<StageName> out;
    for (const auto& raw : split_csv(csv)) {
        std::string name = to_lower(raw);
        if (name == "image") out.insert(StageName::Image);
        else if (name == "threed" || name == "3d") out.insert(StageName::ThreeD);
        else if (name == "llm") throw ConfigError("the llm stage cannot be optional");
        else throw ConfigError("unknown stage in OPTIONAL_STAGES: " + raw);
    }
    return out;
}

PipelineConfig load_config_from_env() {
    PipelineConfig cfg;
    cfg.llm_endpoint = env_str("LLM_SERVICE_URL", cfg.llm_endpoint);
    cfg.image_endpoint = env_str("TEXT_TO_IMAGE_SERVICE_URL", cfg.image_endpoint);
    cfg.threed_endpoint = env_str("THREED_GENERATION_SERVICE_URL", cfg.threed_endpoint);
    cfg.llm_api_key = env_str("LLM_API_KEY", "");
    cfg.image_api_key = env_str("IMAGE_API_KEY", "");
    cfg.threed_api_key = env_str("THREED_API_KEY", "");

    std::string backend = to_lower(env_str("STORAGE_BACKEND", "s3"));
    if (backend == "s3") cfg.storage_backend = StorageBackend::S3;
    else if (backend == "sqlite") cfg.storage_backend = StorageBackend::Sqlite;
    else throw ConfigError("STORAGE_BACKEND must be s3 or sqlite, got " + backend);
    cfg.storage_bucket = env_str("S3_BUCKET_NAME", "");
    cfg.aws_access_key_id = env_str("AWS_ACCESS_KEY_ID", "");
    cfg.aws_secret_access_key = env_str("AWS_SECRET_ACCESS_KEY", "");
    cfg.aws_session_token = env_str("AWS_SESSION_TOKEN", "");
    cfg.aws_region = env_str("AWS_DEFAULT_REGION", cfg.aws_region);
    cfg.s3_endpoint = env_str("S3_ENDPOINT_URL", "");
    cfg.sqlite_path = env_str("STORAGE_SQLITE_PATH", cfg.sqlite_path);

    const long hour = 3600L * 1000L;
    cfg.llm_timeout_ms = env_long("LLM_TIMEOUT_MS", cfg.llm_timeout_ms, 1, hour);
    cfg.image_timeout_ms = env_long("IMAGE_TIMEOUT_MS", cfg.image_timeout_ms, 1, hour);
    cfg.threed_timeout_ms = env_long("THREED_TIMEOUT_MS", cfg.threed_timeout_ms, 1, hour);
    cfg.storage_timeout_ms = env_long("STORAGE_TIMEOUT_MS", cfg.storage_timeout_ms, 1, hour);
    cfg.run_timeout_ms = env_long("RUN_TIMEOUT_MS", cfg.run_timeout_ms, 0, 24 * hour);

    cfg.retry_max_attempts = (int)env_long("RETRY_MAX_ATTEMPTS", cfg.retry_max_attempts, 1, 10);
    cfg.retry_base_delay_ms = env_long("RETRY_BASE_DELAY_MS", cfg.retry_base_delay_ms, 0, 60000);
    cfg.retry_max_delay_ms = env_long("RETRY_MAX_DELAY_MS", cfg.retry_max_delay_ms, 0, 600000);

    cfg.optional_stages = parse_optional_stages(getenv_or("OPTIONAL_STAGES", ""));
    cfg.threed_without_image = env_bool("THREED_WITHOUT_IMAGE", cfg.threed_without_image);
    cfg.persist_metadata = env_bool("PERSIST_METADATA", cfg.persist_metadata);
    std::string handoff = to_lower(env_str("THREED_IMAGE_HANDOFF", "storage_key"));
    if (handoff == "storage_key") cfg.image_handoff = ImageHandoff::StorageKey;
    else if (handoff == "inline") cfg.image_handoff = ImageHandoff::Inline;
    else throw ConfigError("THREED_IMAGE_HANDOFF must be storage_key or inline, got " + handoff);
    cfg.presign_ttl_s = env_long("PRESIGN_TTL_S", cfg.presign_ttl_s, 0, 7L * 24 * 3600);

    cfg.image_inference_steps = (int)env_long("IMAGE_INFERENCE_STEPS", cfg.image_inference_steps, 1, 500);
    cfg.image_guidance_scale = env_double("IMAGE_GUIDANCE_SCALE", cfg.image_guidance_scale, 0.0, 50.0);
    cfg.threed_model_id = env_str("THREED_MODEL_ID", cfg.threed_model_id);
    cfg.max_prompt_chars = (std::size_t)env_long("MAX_PROMPT_CHARS", (long)cfg.max_prompt_chars, 1, 100000);
    cfg.max_image_bytes = (std::size_t)env_long("MAX_IMAGE_BYTES", (long)cfg.max_image_bytes, 1, 512L * 1024 * 1024);

    cfg.server_port = (int)env_long("SERVER_PORT", cfg.server_port, 1, 65535);
    cfg.server_workers = (int)env_long("SERVER_WORKERS", cfg.server_workers, 1, 256);
    cfg.server_max_finished = (std::size_t)env_long("SERVER_MAX_FINISHED", (long)cfg.server_max_finished, 1, 1000000);

    validate_config(cfg);
    return cfg;
}

void validate_config(const PipelineConfig& cfg) {
    check_endpoint("LLM_SERVICE_URL", cfg.llm_endpoint);
    check_endpoint("TEXT_TO_IMAGE_SERVICE_URL", cfg.image_endpoint);
    check_endpoint("THREED_GENERATION_SERVICE_URL", cfg.threed_endpoint);
    if (cfg.is_optional(StageName::Llm)) throw ConfigError("the llm stage cannot be optional");
    if (cfg.retry_max_attempts < 1) throw ConfigError("RETRY_MAX_ATTEMPTS must be at least 1");
    if (cfg.retry_max_delay_ms < cfg.retry_base_delay_ms) {
        throw ConfigError("RETRY_MAX_DELAY_MS must not be below RETRY_BASE_DELAY_MS");
    }
    if (cfg.threed_model_id.empty()) throw ConfigError("THREED_MODEL_ID must not be empty");
    if (cfg.storage_backend == StorageBackend::S3) {
        if (cfg.storage_bucket.empty()) throw ConfigError("S3_BUCKET_NAME is required for the s3 storage backend");
        if (cfg.aws_access_key_id.empty() || cfg.aws_secret_access_key.empty()) {
            throw ConfigError("AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY are required for the s3 storage backend");
        }
        if (!cfg.s3_endpoint.empty()) check_endpoint("S3_ENDPOINT_URL", cfg.s3_endpoint);
    } else if (cfg.sqlite_path.empty()) {
        throw ConfigError("STORAGE_SQLITE_PATH must not be empty");
    }
}
