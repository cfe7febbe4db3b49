#include "../include/pipeline.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace {
const char* kTag = "orchestrator";

json metadata_document(const PipelineRun& run) {
    json doc = {
        {"run_id", run.id},
        {"prompt", run.request.prompt},
        {"style", run.request.style ? json(*run.request.style) : json(nullptr)},
        {"expanded_prompt", run.text},
        {"specification", run.spec},
        {"image_key", run.image_ref ? json(run.image_ref->key) : json(nullptr)},
        {"model_key", run.model_ref ? json(run.model_ref->key) : json(nullptr)},
        {"created_at", run.started_at}
    };
    if (const StageResult* r = run.result_for(StageName::ThreeD)) {
        const auto& details = r->metadata().details;
        if (r->ok()) doc["model_id"] = details.value("model_id", std::string());
        if (details.contains("image_key")) doc["intermediate_image_s3_key"] = details["image_key"];
    }
    return doc;
}

void discard_artifacts(PipelineRun& run) {
    for (auto& r : run.stages) {
        if (r.ok()) r.value().artifact.reset();
    }
}
}

std::chrono::milliseconds derive_run_budget(const PipelineConfig& cfg, const LlmClient& llm,
                                            const ImageClient& image, const ThreeDClient& threed) {
    RetryPolicy p = cfg.retry_policy();
    const long attempts = std::max(1, p.max_attempts);
    // head + write per attempt
    auto per_put = std::chrono::milliseconds(cfg.storage_timeout_ms * 2 * attempts) + p.worst_case_backoff();
    // the 3D stage may download the mesh after generating it
    return llm.worst_case_budget() + image.worst_case_budget() + threed.worst_case_budget() * 2 +
           per_put * 3 + std::chrono::milliseconds(5000);
}

Orchestrator::Orchestrator(const PipelineConfig& cfg, LlmClient& llm, ImageClient& image, ThreeDClient& threed,
                           StorageClient& storage)
    : cfg_(cfg), llm_(llm), image_(image), threed_(threed), storage_(storage) {
    if (cfg_.is_optional(StageName::Llm)) throw ConfigError("the llm stage cannot be optional");
    run_budget_ = cfg_.run_timeout_ms > 0 ? std::chrono::milliseconds(cfg_.run_timeout_ms)
                                          : derive_run_budget(cfg_, llm_, image_, threed_);
}

PipelineRun Orchestrator::run(const GenerationRequest& req, CancelToken& cancel, const std::string& run_id) const {
    auto started = std::chrono::steady_clock::now();
    PipelineRun run;
    run.id = run_id.empty() ? gen_id() : run_id;
    run.request = req;
    run.started_at = utc_timestamp();
    run.stages.reserve(3);

    auto left = cancel.remaining();
    if (!left || *left > run_budget_) cancel.set_deadline(CancelToken::clock::now() + run_budget_);

    log_info(kTag, "run=" + run.id + " accepted prompt_chars=" + std::to_string(req.prompt.size()) +
                   " budget_ms=" + std::to_string(run_budget_.count()));
    execute(run, cancel);

    if (run.state == RunState::Aborted) discard_artifacts(run);
    run.elapsed_ms = elapsed_ms(started);
    std::string summary = "run=" + run.id + " finished status=" + to_string(run.status) +
                          " elapsed_ms=" + std::to_string(run.elapsed_ms);
    if (run.status == RunStatus::Completed || run.status == RunStatus::PartiallyCompleted) log_info(kTag, summary);
    else log_warn(kTag, summary);
    return run;
}

void Orchestrator::execute(PipelineRun& run, const CancelToken& cancel) const {
    if (auto problem = validate_request(run.request, cfg_.max_prompt_chars)) {
        abort(run, RunStatus::Failed, "request", ErrorKind::Validation, *problem);
        return;
    }

    // LLM: always required.
    if (cancelled_between_stages(run, cancel)) return;
    enter(run, RunState::LlmStage);
    run.stages.push_back(llm_.invoke(run.request, cancel));
    if (!run.stages.back().ok()) {
        stage_failed(run, run.stages.back());
        return;
    }
    run.outcomes[StageName::Llm] = StageOutcome::Succeeded;
    run.text = run.stages.back().value().text;
    run.spec = run.stages.back().value().spec;

    // Image: fed the expanded prompt.
    if (cancelled_between_stages(run, cancel)) return;
    enter(run, RunState::ImageStage);
    run.stages.push_back(image_.invoke(run.text, cancel));
    const Artifact* image = nullptr;
    if (run.stages.back().ok() && run.stages.back().value().artifact) {
        run.outcomes[StageName::Image] = StageOutcome::Succeeded;
        image = &*run.stages.back().value().artifact;
    } else if (run.stages.back().ok()) {
        abort(run, RunStatus::Failed, "image", ErrorKind::Unexpected, "image stage produced no artifact");
        return;
    } else if (stage_failed(run, run.stages.back())) {
        return;
    }

    // 3D: fed the expanded prompt and the image. Without an image it only
    // runs when text-only generation is allowed.
    ImageInput handoff;
    if (image && cfg_.image_handoff == ImageHandoff::StorageKey) {
        if (!persist_image(run, cancel)) return;
        handoff.storage_key = run.image_ref->key;
    } else if (image) {
        handoff.bytes = image;
    }
    if (handoff.empty() && !cfg_.threed_without_image) {
        run.outcomes[StageName::ThreeD] = StageOutcome::Skipped;
        log_info(kTag, "run=" + run.id + " stage=threed skipped: no image");
    } else {
        if (cancelled_between_stages(run, cancel)) return;
        enter(run, RunState::ThreeDStage);
        StageResult mesh = threed_.invoke(run.text, handoff, run.request.shape, cancel);
        run.stages.push_back(std::move(mesh));
        if (run.stages.back().ok()) {
            run.outcomes[StageName::ThreeD] = StageOutcome::Succeeded;
        } else if (stage_failed(run, run.stages.back())) {
            return;
        }
    }

    persist(run, cancel);
}

void Orchestrator::persist(PipelineRun& run, const CancelToken& cancel) const {
    if (cancelled_between_stages(run, cancel)) return;
    enter(run, RunState::Persisting);

    if (!persist_image(run, cancel)) return;

    StageResult* mesh = run.result_for(StageName::ThreeD);
    if (mesh && mesh->ok() && mesh->value().artifact) {
        std::string ext = mesh->metadata().details.value("extension", std::string());
        Artifact a = std::move(*mesh->value().artifact);
        mesh->value().artifact.reset();
        if (ext.empty()) ext = mesh_extension("", a.content_type);
        a.key = "models/" + run.id + ext;
        if (!put_artifact(run, std::move(a), run.model_ref, cancel)) return;
    }

    if (cfg_.persist_metadata) {
        Artifact doc("metadata/" + run.id + "_metadata.json", "application/json", metadata_document(run).dump(2));
        if (!put_artifact(run, std::move(doc), run.metadata_ref, cancel)) return;
    }

    if (cfg_.presign_ttl_s > 0) {
        std::chrono::seconds ttl(cfg_.presign_ttl_s);
        if (run.image_ref) run.image_presigned_url = storage_.presign(run.image_ref->key, ttl);
        if (run.model_ref) run.model_presigned_url = storage_.presign(run.model_ref->key, ttl);
    }

    bool partial = std::any_of(run.outcomes.begin(), run.outcomes.end(), [](const auto& kv) {
        return kv.second != StageOutcome::Succeeded;
    });
    run.status = partial ? RunStatus::PartiallyCompleted : RunStatus::Completed;
    enter(run, RunState::Completed);
}

bool Orchestrator::persist_image(PipelineRun& run, const CancelToken& cancel) const {
    StageResult* img = run.result_for(StageName::Image);
    if (!img || !img->ok() || !img->value().artifact) return true;
    Artifact a = std::move(*img->value().artifact);
    img->value().artifact.reset();
    a.key = "images/" + run.id + extension_for(a.content_type);
    return put_artifact(run, std::move(a), run.image_ref, cancel);
}

bool Orchestrator::put_artifact(PipelineRun& run, Artifact artifact, std::optional<Reference>& into,
                                const CancelToken& cancel) const {
    if (cancelled_between_stages(run, cancel)) return false;
    const std::string key = artifact.key;
    auto r = storage_.put(std::move(artifact), cancel);
    if (!r.value) {
        RunStatus status = r.failure.kind == ErrorKind::Cancelled ? RunStatus::Aborted : RunStatus::Failed;
        abort(run, status, "storage", r.failure.kind, key + ": " + r.failure.message);
        return false;
    }
    log_info(kTag, "run=" + run.id + " stored key=" + key + " attempts=" + std::to_string(r.attempts));
    into = std::move(r.value);
    return true;
}

bool Orchestrator::stage_failed(PipelineRun& run, const StageResult& result) const {
    const Failure& f = result.error();
    const std::string stage = to_string(result.stage());
    run.outcomes[result.stage()] = StageOutcome::Failed;
    log_warn(kTag, "run=" + run.id + " stage=" + stage + " failed kind=" + to_string(f.kind) +
                   " attempts=" + std::to_string(result.metadata().attempts) + ": " + f.message);
    if (f.kind == ErrorKind::Cancelled) {
        abort(run, RunStatus::Aborted, stage, f.kind, f.message);
        return true;
    }
    if (!cfg_.is_optional(result.stage())) {
        abort(run, RunStatus::Failed, stage, f.kind, f.message);
        return true;
    }
    run.errors.push_back({stage, f.kind, f.message});
    return false;
}

void Orchestrator::abort(PipelineRun& run, RunStatus status, const std::string& stage, ErrorKind kind,
                         const std::string& message) const {
    run.errors.push_back({stage, kind, message});
    run.status = status;
    enter(run, RunState::Aborted);
}

bool Orchestrator::cancelled_between_stages(PipelineRun& run, const CancelToken& cancel) const {
    if (!cancel.cancelled()) return false;
    abort(run, RunStatus::Aborted, "run", ErrorKind::Cancelled,
          cancel.cancel_requested() ? "cancelled" : "run deadline exceeded");
    return true;
}

void Orchestrator::enter(PipelineRun& run, RunState state) const {
    log_info(kTag, "run=" + run.id + " " + to_string(run.state) + " -> " + to_string(state));
    run.state = state;
}
