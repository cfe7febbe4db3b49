#include "../include/artifact.hpp"
#include "../include/util.hpp"

std::string base_media_type(const std::string& content_type) {
    auto semi = content_type.find(';');
    return to_lower(trim(content_type.substr(0, semi)));
}

std::string extension_for(const std::string& content_type) {
    auto t = base_media_type(content_type);
    if (t == "image/png") return ".png";
    if (t == "image/jpeg" || t == "image/jpg") return ".jpg";
    if (t == "image/webp") return ".webp";
    if (t == "model/gltf-binary") return ".glb";
    if (t == "model/gltf+json" || t == "model/vnd.gltf+json") return ".gltf";
    if (t == "model/obj") return ".obj";
    if (t == "application/json") return ".json";
    return ".bin";
}
