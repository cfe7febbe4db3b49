#pragma once
#include "pipeline_config.hpp"
#include "pipeline_run.hpp"
#include "../../../shared/cpp/backend_sdk/include/image_client.hpp"
#include "../../../shared/cpp/backend_sdk/include/llm_client.hpp"
#include "../../../shared/cpp/backend_sdk/include/threed_client.hpp"
#include "../../../shared/cpp/common/include/cancel.hpp"
#include "../../../shared/cpp/storage_sdk/include/storage_client.hpp"
#include <chrono>

// Drives one run through LLM -> image -> 3D -> persisting. Holds no per-run
// state, so a single instance serves concurrent runs from several threads.
class Orchestrator {
public:
    Orchestrator(const PipelineConfig& cfg, LlmClient& llm, ImageClient& image, ThreeDClient& threed,
                 StorageClient& storage);

    // Runs to a terminal state on the calling thread. The token is cancelled
    // by the caller or, once the run budget is spent, by its deadline.
    // An empty run_id gets a fresh random id.
    PipelineRun run(const GenerationRequest& req, CancelToken& cancel, const std::string& run_id = "") const;

    std::chrono::milliseconds run_budget() const { return run_budget_; }

private:
    void execute(PipelineRun& run, const CancelToken& cancel) const;
    bool stage_failed(PipelineRun& run, const StageResult& result) const;
    void abort(PipelineRun& run, RunStatus status, const std::string& stage, ErrorKind kind,
               const std::string& message) const;
    bool cancelled_between_stages(PipelineRun& run, const CancelToken& cancel) const;
    void enter(PipelineRun& run, RunState state) const;
    void persist(PipelineRun& run, const CancelToken& cancel) const;
    // No-op when there is no image left to store; false once the run aborted.
    bool persist_image(PipelineRun& run, const CancelToken& cancel) const;
    bool put_artifact(PipelineRun& run, Artifact artifact, std::optional<Reference>& into,
                      const CancelToken& cancel) const;

    const PipelineConfig& cfg_;
    LlmClient& llm_;
    ImageClient& image_;
    ThreeDClient& threed_;
    StorageClient& storage_;
    std::chrono::milliseconds run_budget_{0};
};

// Sum of every stage's worst case plus one storage put per artifact.
std::chrono::milliseconds derive_run_budget(const PipelineConfig& cfg, const LlmClient& llm,
                                            const ImageClient& image, const ThreeDClient& threed);
