#pragma once
#include "../../../shared/cpp/backend_sdk/include/generation_request.hpp"
#include "../../../shared/cpp/backend_sdk/include/stage_result.hpp"
#include "../../../shared/cpp/common/include/artifact.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class RunState { Pending, LlmStage, ImageStage, ThreeDStage, Persisting, Completed, Aborted };
enum class RunStatus { Completed, PartiallyCompleted, Failed, Aborted };
enum class StageOutcome { NotRun, Succeeded, Failed, Skipped };

const char* to_string(RunState state);
const char* to_string(RunStatus status);
const char* to_string(StageOutcome outcome);

struct ErrorDescriptor {
    std::string stage; // llm | image | threed | storage | request | run
    ErrorKind kind{ErrorKind::Unexpected};
    std::string message;
};

// Everything one run produced. Stage results are appended in the order the
// stages ran; a stage that was skipped or never reached has no entry.
struct PipelineRun {
    std::string id;
    GenerationRequest request;
    RunState state{RunState::Pending};
    RunStatus status{RunStatus::Failed}; // meaningful once state is terminal
    std::vector<StageResult> stages;
    std::map<StageName, StageOutcome> outcomes{
        {StageName::Llm, StageOutcome::NotRun},
        {StageName::Image, StageOutcome::NotRun},
        {StageName::ThreeD, StageOutcome::NotRun}};
    std::vector<ErrorDescriptor> errors;

    std::string text;     // expanded prompt
    nlohmann::json spec;  // full LLM output
    std::optional<Reference> image_ref;
    std::optional<Reference> model_ref;
    std::optional<Reference> metadata_ref;
    std::string image_presigned_url;
    std::string model_presigned_url;

    std::string started_at;
    long elapsed_ms{0};

    bool terminal() const { return state == RunState::Completed || state == RunState::Aborted; }
    const StageResult* result_for(StageName stage) const;
    StageResult* result_for(StageName stage);
};

nlohmann::json to_json(const PipelineRun& run);
