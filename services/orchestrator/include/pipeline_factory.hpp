#pragma once
#include "pipeline.hpp"
#include "../../../shared/cpp/common/include/http.hpp"
#include "../../../shared/cpp/storage_sdk/include/object_store.hpp"
#include <memory>

// Owns the process-wide collaborators of the orchestrator. Built once at
// startup; members are declared in dependency order so they are torn down
// in reverse.
struct PipelineServices {
    const PipelineConfig& config;
    std::unique_ptr<HttpTransport> transport;
    std::unique_ptr<ObjectStore> store;
    std::unique_ptr<StorageClient> storage;
    std::unique_ptr<LlmClient> llm;
    std::unique_ptr<ImageClient> image;
    std::unique_ptr<ThreeDClient> threed;
    std::unique_ptr<Orchestrator> orchestrator;

    explicit PipelineServices(const PipelineConfig& cfg) : config(cfg) {}
};

// Throws ConfigError or StorageError when the store cannot be set up.
std::unique_ptr<ObjectStore> make_object_store(const PipelineConfig& cfg, HttpTransport& transport);

// `transport` defaults to a CurlTransport.
std::unique_ptr<PipelineServices> build_pipeline(const PipelineConfig& cfg,
                                                 std::unique_ptr<HttpTransport> transport = nullptr);
