#include "../include/generation_request.hpp"
#include "../../common/include/util.hpp"

using json = nlohmann::json;

std::optional<std::string> validate_request(const GenerationRequest& req, std::size_t max_prompt_chars) {
    if (trim(req.prompt).empty()) return std::string("prompt is empty");
    if (utf8_length(req.prompt) > max_prompt_chars) {
        return "prompt exceeds " + std::to_string(max_prompt_chars) + " characters";
    }
    if (req.style && utf8_length(*req.style) > max_prompt_chars) return std::string("style is too long");
    if (req.shape.octree_resolution &&
        (*req.shape.octree_resolution < 64 || *req.shape.octree_resolution > 1024)) {
        return std::string("octree_resolution must be within 64..1024");
    }
    if (req.shape.face_count && (*req.shape.face_count < 1000 || *req.shape.face_count > 500000)) {
        return std::string("face_count must be within 1000..500000");
    }
    if (req.priority != "high" && req.priority != "low") return std::string("priority must be high or low");
    return std::nullopt;
}

GenerationRequest request_from_json(const json& j) {
    GenerationRequest req;
    req.prompt = j.at("prompt").get<std::string>();
    if (j.contains("style") && !j["style"].is_null()) req.style = j["style"].get<std::string>();
    if (j.contains("shape") && j["shape"].is_object()) {
        const auto& s = j["shape"];
        if (s.contains("octree_resolution")) req.shape.octree_resolution = s["octree_resolution"].get<int>();
        if (s.contains("face_count")) req.shape.face_count = s["face_count"].get<int>();
        if (s.contains("texture")) req.shape.texture = s["texture"].get<bool>();
    }
    req.priority = j.value("priority", std::string("low"));
    return req;
}

json to_json(const GenerationRequest& req) {
    json j = {{"prompt", req.prompt}, {"priority", req.priority}};
    if (req.style) j["style"] = *req.style;
    json shape = json::object();
    if (req.shape.octree_resolution) shape["octree_resolution"] = *req.shape.octree_resolution;
    if (req.shape.face_count) shape["face_count"] = *req.shape.face_count;
    if (req.shape.texture) shape["texture"] = *req.shape.texture;
    if (!shape.empty()) j["shape"] = shape;
    return j;
}
