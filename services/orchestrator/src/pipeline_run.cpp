#include "../include/pipeline_run.hpp"

using json = nlohmann::json;

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Pending: return "pending";
        case RunState::LlmStage: return "llm";
        case RunState::ImageStage: return "image";
        case RunState::ThreeDStage: return "threed";
        case RunState::Persisting: return "persisting";
        case RunState::Completed: return "completed";
        case RunState::Aborted: return "aborted";
    }
    return "unknown";
}

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::PartiallyCompleted: return "partially_completed";
        case RunStatus::Failed: return "failed";
        case RunStatus::Aborted: return "aborted";
    }
    return "unknown";
}

const char* to_string(StageOutcome outcome) {
    switch (outcome) {
        case StageOutcome::NotRun: return "not_run";
        case StageOutcome::Succeeded: return "succeeded";
        case StageOutcome::Failed: return "failed";
        case StageOutcome::Skipped: return "skipped";
    }
    return "unknown";
}

const StageResult* PipelineRun::result_for(StageName stage) const {
    for (const auto& r : stages) {
        if (r.stage() == stage) return &r;
    }
    return nullptr;
}

StageResult* PipelineRun::result_for(StageName stage) {
    for (auto& r : stages) {
        if (r.stage() == stage) return &r;
    }
    return nullptr;
}

json to_json(const PipelineRun& run) {
    json stages = json::array();
    for (const auto& kv : run.outcomes) {
        json s = {{"stage", to_string(kv.first)}, {"outcome", to_string(kv.second)}};
        if (const StageResult* r = run.result_for(kv.first)) {
            s["attempts"] = r->metadata().attempts;
            s["elapsed_ms"] = r->metadata().elapsed_ms;
            s["details"] = r->metadata().details;
            if (!r->ok()) {
                s["error"] = {{"kind", to_string(r->error().kind)}, {"message", r->error().message}};
            }
        }
        stages.push_back(std::move(s));
    }

    json errors = json::array();
    for (const auto& e : run.errors) {
        errors.push_back({{"stage", e.stage}, {"kind", to_string(e.kind)}, {"message", e.message}});
    }

    auto url_of = [](const std::optional<Reference>& ref) -> json {
        return ref ? json(ref->url) : json(nullptr);
    };

    json out = {
        {"id", run.id},
        {"status", to_string(run.status)},
        {"state", to_string(run.state)},
        {"request", to_json(run.request)},
        {"text", run.text},
        {"spec", run.spec},
        {"image_url", url_of(run.image_ref)},
        {"model_url", url_of(run.model_ref)},
        {"metadata_url", url_of(run.metadata_ref)},
        {"stages", stages},
        {"errors", errors},
        {"started_at", run.started_at},
        {"elapsed_ms", run.elapsed_ms}
    };
    if (run.image_ref) out["image_key"] = run.image_ref->key;
    if (run.model_ref) out["model_key"] = run.model_ref->key;
    if (!run.image_presigned_url.empty()) out["image_presigned_url"] = run.image_presigned_url;
    if (!run.model_presigned_url.empty()) out["model_presigned_url"] = run.model_presigned_url;
    return out;
}
