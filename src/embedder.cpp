#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <cmath>
#include <iostream>

namespace lookbook {

double inner_product(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) return 0.0;
    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return dot;
}

bool l2_normalize(Embedding& v) {
    double ss = 0.0;
    for (float x : v) ss += static_cast<double>(x) * static_cast<double>(x);
    if (!std::isfinite(ss) || ss <= 1e-24) return false;
    double inv = 1.0 / std::sqrt(ss);
    for (float& x : v) x = static_cast<float>(x * inv);
    return true;
}

Embedding placeholder_embedding(uint32_t dims) {
    if (dims == 0) return {};
    return Embedding(dims, static_cast<float>(1.0 / std::sqrt(static_cast<double>(dims))));
}

std::unique_ptr<EmbeddingProvider> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embedder;

    if (emb.provider == "http") {
        HttpEmbedder::Settings s;
        s.name = "http";
        s.base_url = emb.base_url;
        s.model = emb.model;
        s.api_key = emb.api_key;
        s.response_path = emb.response_path;
        s.batch_size = emb.batch_size;
        s.timeout_seconds = emb.timeout_seconds;
        s.default_dims = emb.dimensions;
        return std::make_unique<HttpEmbedder>(std::move(s), http);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << emb.provider << "\n";
    return nullptr;
}

} // namespace lookbook
