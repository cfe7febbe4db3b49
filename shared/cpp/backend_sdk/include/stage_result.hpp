#pragma once
#include "../../common/include/artifact.hpp"
#include "../../common/include/errors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

enum class StageName { Llm, Image, ThreeD };

const char* to_string(StageName stage); // "llm" | "image" | "threed"

struct StageMetadata {
    int attempts{0};
    long elapsed_ms{0};
    nlohmann::json details = nlohmann::json::object();
};

struct StageSuccess {
    std::string text;                 // LLM: expanded prompt
    nlohmann::json spec;              // LLM: full structured output; null otherwise
    std::optional<Artifact> artifact; // image / mesh
};

// Tagged outcome of one backend invocation.
class StageResult {
public:
    static StageResult success(StageName stage, StageSuccess value, StageMetadata meta);
    static StageResult failure(StageName stage, Failure error, StageMetadata meta = {});

    StageName stage() const { return stage_; }
    bool ok() const { return std::holds_alternative<StageSuccess>(outcome_); }

    // Both throw std::logic_error when called on the other alternative.
    const StageSuccess& value() const;
    StageSuccess& value();
    const Failure& error() const;

    const StageMetadata& metadata() const { return meta_; }

private:
    StageResult(StageName stage, std::variant<StageSuccess, Failure> outcome, StageMetadata meta)
        : stage_(stage), outcome_(std::move(outcome)), meta_(std::move(meta)) {}

    StageName stage_;
    std::variant<StageSuccess, Failure> outcome_;
    StageMetadata meta_;
};
