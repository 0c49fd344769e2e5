#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace lookbook {

// Embedding provider backed by an HTTP model server (e.g. a CLIP sidecar).
// Texts are posted to <base_url>/embed/text, images (base64 file bytes) to
// <base_url>/embed/image, both as {"model": ..., "input": [...]}. The float
// arrays are read from the JSON pointer response_path.
class HttpEmbedder : public EmbeddingProvider {
public:
    struct Settings {
        std::string name = "http";
        std::string base_url;
        std::string model;
        std::string api_key;                       // empty = no Authorization header
        std::string response_path = "/embeddings"; // JSON pointer to array of arrays
        uint32_t batch_size = 32;
        uint32_t timeout_seconds = 600;
        uint32_t default_dims = 512;               // fallback until first response
    };

    HttpEmbedder(Settings settings, HttpClient& http);

    std::vector<Embedding> encode_images(const std::vector<std::string>& paths) override;
    std::vector<Embedding> encode_texts(const std::vector<std::string>& texts) override;
    uint32_t dimensions() const override { return dimensions_.load(); }
    std::string embedder_name() const override { return settings_.name; }

private:
    // Encode inputs batch by batch; a failed batch is retried item by item
    // and items that still fail stay empty.
    std::vector<std::optional<Embedding>> encode_all(const std::string& endpoint,
                                                     const std::vector<std::string>& inputs);

    std::optional<std::vector<Embedding>> request(const std::string& endpoint,
                                                  const std::vector<std::string>& inputs);

    std::vector<Embedding> finish(std::vector<std::optional<Embedding>> slots,
                                  const char* kind);

    Settings settings_;
    HttpClient& http_;
    std::atomic<uint32_t> dimensions_;
};

} // namespace lookbook
