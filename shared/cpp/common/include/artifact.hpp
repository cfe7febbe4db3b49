#pragma once
#include <string>
#include <utility>

// Generated binary awaiting durable storage. Move-only: exactly one owner
// holds the bytes until the storage client consumes them.
struct Artifact {
    std::string key;           // storage key, e.g. "images/<run>.png"
    std::string content_type;
    std::string bytes;

    Artifact() = default;
    Artifact(std::string k, std::string ctype, std::string b)
        : key(std::move(k)), content_type(std::move(ctype)), bytes(std::move(b)) {}
    Artifact(Artifact&&) = default;
    Artifact& operator=(Artifact&&) = default;
    Artifact(const Artifact&) = delete;
    Artifact& operator=(const Artifact&) = delete;
};

// Durable handle returned by the storage client.
struct Reference {
    std::string key;
    std::string url;
};

// Media type without parameters, lower-cased: "image/png; x=y" -> "image/png".
std::string base_media_type(const std::string& content_type);

// File extension (with dot) for a media type; ".bin" when unknown.
std::string extension_for(const std::string& content_type);
