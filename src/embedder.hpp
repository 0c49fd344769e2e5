#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace lookbook {

using Embedding = std::vector<float>;

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface. Both calls are batched, keep input
// order, and return unit-norm vectors. A failed item yields a placeholder
// vector instead of failing the whole batch.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<Embedding> encode_images(const std::vector<std::string>& paths) = 0;

    virtual std::vector<Embedding> encode_texts(const std::vector<std::string>& texts) = 0;

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "http")
    virtual std::string embedder_name() const = 0;
};

// Inner product of two equal-length vectors; 0.0 on length mismatch.
double inner_product(const Embedding& a, const Embedding& b);

// Scale v to unit length in place. Returns false (v untouched) for a zero
// or non-finite vector.
bool l2_normalize(Embedding& v);

// Uniform unit vector used in place of an embedding that could not be computed.
Embedding placeholder_embedding(uint32_t dims);

// Create an embedding provider from config. Returns nullptr if the
// configured provider is not recognized.
std::unique_ptr<EmbeddingProvider> create_embedder(const Config& config, HttpClient& http);

} // namespace lookbook
