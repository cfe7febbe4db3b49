#include "../include/pipeline_factory.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/storage_sdk/include/s3_store.hpp"
#include "../../../shared/cpp/storage_sdk/include/sqlite_store.hpp"

std::unique_ptr<ObjectStore> make_object_store(const PipelineConfig& cfg, HttpTransport& transport) {
    if (cfg.storage_backend == StorageBackend::Sqlite) {
        return std::make_unique<SqliteStore>(cfg.sqlite_path);
    }
    S3Options opts;
    opts.bucket = cfg.storage_bucket;
    opts.region = cfg.aws_region;
    opts.endpoint = cfg.s3_endpoint;
    opts.credentials.access_key_id = cfg.aws_access_key_id;
    opts.credentials.secret_access_key = cfg.aws_secret_access_key;
    opts.credentials.session_token = cfg.aws_session_token;
    opts.timeout_ms = cfg.storage_timeout_ms;
    return std::make_unique<S3Store>(transport, opts);
}

std::unique_ptr<PipelineServices> build_pipeline(const PipelineConfig& cfg, std::unique_ptr<HttpTransport> transport) {
    auto svc = std::make_unique<PipelineServices>(cfg);
    if (transport) svc->transport = std::move(transport);
    else svc->transport = std::make_unique<CurlTransport>();
    svc->store = make_object_store(cfg, *svc->transport);
    const RetryPolicy retry = cfg.retry_policy();
    svc->storage = std::make_unique<StorageClient>(*svc->store, retry);

    BackendOptions llm_opts{cfg.llm_endpoint, cfg.llm_api_key, cfg.llm_timeout_ms, retry};
    BackendOptions image_opts{cfg.image_endpoint, cfg.image_api_key, cfg.image_timeout_ms, retry};
    BackendOptions threed_opts{cfg.threed_endpoint, cfg.threed_api_key, cfg.threed_timeout_ms, retry};

    svc->llm = std::make_unique<LlmClient>(*svc->transport, llm_opts, cfg.max_prompt_chars);
    ImageParams image_params;
    image_params.inference_steps = cfg.image_inference_steps;
    image_params.guidance_scale = cfg.image_guidance_scale;
    svc->image = std::make_unique<ImageClient>(*svc->transport, image_opts, image_params);
    ThreeDParams threed_params;
    threed_params.model_id = cfg.threed_model_id;
    threed_params.max_image_bytes = cfg.max_image_bytes;
    svc->threed = std::make_unique<ThreeDClient>(*svc->transport, threed_opts, threed_params);

    svc->orchestrator = std::make_unique<Orchestrator>(cfg, *svc->llm, *svc->image, *svc->threed, *svc->storage);
    log_info("orchestrator", std::string("pipeline ready storage=") + svc->store->name() +
                             " optional_stages=" + std::to_string(cfg.optional_stages.size()) +
                             " run_budget_ms=" + std::to_string(svc->orchestrator->run_budget().count()));
    return svc;
}
