#include "../include/stage_result.hpp"
#include <stdexcept>

const char* to_string(StageName stage) {
    switch (stage) {
        case StageName::Llm: return "llm";
        case StageName::Image: return "image";
        case StageName::ThreeD: return "threed";
    }
    return "unknown";
}

StageResult StageResult::success(StageName stage, StageSuccess value, StageMetadata meta) {
    return StageResult(stage, std::variant<StageSuccess, Failure>(std::in_place_type<StageSuccess>, std::move(value)),
                       std::move(meta));
}

StageResult StageResult::failure(StageName stage, Failure error, StageMetadata meta) {
    return StageResult(stage, std::variant<StageSuccess, Failure>(std::in_place_type<Failure>, std::move(error)),
                       std::move(meta));
}

const StageSuccess& StageResult::value() const {
    if (!ok()) throw std::logic_error(std::string("stage ") + to_string(stage_) + " did not succeed");
    return std::get<StageSuccess>(outcome_);
}

StageSuccess& StageResult::value() {
    if (!ok()) throw std::logic_error(std::string("stage ") + to_string(stage_) + " did not succeed");
    return std::get<StageSuccess>(outcome_);
}

const Failure& StageResult::error() const {
    if (ok()) throw std::logic_error(std::string("stage ") + to_string(stage_) + " succeeded");
    return std::get<Failure>(outcome_);
}
