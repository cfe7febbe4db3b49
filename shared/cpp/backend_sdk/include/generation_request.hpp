#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

struct ShapeParams {
    std::optional<int> octree_resolution; // 64..1024
    std::optional<int> face_count;        // 1000..500000
    std::optional<bool> texture;
};

// User seed input. Immutable once accepted by an entrypoint.
struct GenerationRequest {
    std::string prompt;
    std::optional<std::string> style;
    ShapeParams shape;
    std::string priority{"low"}; // high|low, only used by the server's run queue
};

// First problem found, or nullopt when the request is acceptable.
std::optional<std::string> validate_request(const GenerationRequest& req, std::size_t max_prompt_chars);

// Throws nlohmann::json::exception on type mismatch.
GenerationRequest request_from_json(const nlohmann::json& j);
nlohmann::json to_json(const GenerationRequest& req);
