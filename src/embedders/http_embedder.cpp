#include "http_embedder.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace lookbook {

HttpEmbedder::HttpEmbedder(Settings settings, HttpClient& http)
    : settings_(std::move(settings))
    , http_(http)
    , dimensions_(settings_.default_dims)
{
    if (settings_.batch_size == 0) settings_.batch_size = 1;
}

std::optional<std::vector<Embedding>> HttpEmbedder::request(
    const std::string& endpoint, const std::vector<std::string>& inputs) {
    nlohmann::json body = {
        {"model", settings_.model},
        {"input", inputs}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!settings_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + settings_.api_key});
    }

    auto response = http_.post(settings_.base_url + endpoint, body.dump(), headers,
                               static_cast<long>(settings_.timeout_seconds));
    if (response.status_code != 200) {
        std::cerr << "[embedder] " << endpoint << " returned status "
                  << response.status_code << "\n";
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(settings_.response_path));
        if (!arr.is_array() || arr.size() != inputs.size()) {
            std::cerr << "[embedder] " << endpoint << " returned "
                      << (arr.is_array() ? arr.size() : 0) << " vectors for "
                      << inputs.size() << " inputs\n";
            return std::nullopt;
        }

        std::vector<Embedding> out;
        out.reserve(arr.size());
        for (const auto& row : arr) {
            Embedding v;
            v.reserve(row.size());
            for (const auto& val : row) {
                double d = val.get<double>();
                if (!std::isfinite(d) || std::abs(d) > std::numeric_limits<float>::max()) {
                    // Left empty, so the item becomes a placeholder
                    v.clear();
                    break;
                }
                v.push_back(static_cast<float>(d));
            }
            out.push_back(std::move(v));
        }
        return out;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[embedder] Bad response from " << endpoint << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

std::vector<std::optional<Embedding>> HttpEmbedder::encode_all(
    const std::string& endpoint, const std::vector<std::string>& inputs) {
    std::vector<std::optional<Embedding>> slots(inputs.size());
    const size_t batch = settings_.batch_size;

    for (size_t start = 0; start < inputs.size(); start += batch) {
        size_t end = std::min(inputs.size(), start + batch);
        std::vector<std::string> chunk(inputs.begin() + static_cast<std::ptrdiff_t>(start),
                                       inputs.begin() + static_cast<std::ptrdiff_t>(end));

        auto vectors = request(endpoint, chunk);
        if (vectors) {
            for (size_t i = 0; i < vectors->size(); ++i) {
                slots[start + i] = std::move((*vectors)[i]);
            }
            continue;
        }

        if (chunk.size() == 1) continue;
        for (size_t i = 0; i < chunk.size(); ++i) {
            auto single = request(endpoint, {chunk[i]});
            if (single) slots[start + i] = std::move(single->front());
        }
    }
    return slots;
}

std::vector<Embedding> HttpEmbedder::finish(std::vector<std::optional<Embedding>> slots,
                                            const char* kind) {
    // Learn the width from the first usable vector
    for (const auto& s : slots) {
        if (s && !s->empty()) {
            dimensions_.store(static_cast<uint32_t>(s->size()));
            break;
        }
    }

    const uint32_t dims = dimensions_.load();
    size_t failed = 0;
    std::vector<Embedding> out;
    out.reserve(slots.size());
    for (auto& s : slots) {
        if (s && s->size() == dims && l2_normalize(*s)) {
            out.push_back(std::move(*s));
        } else {
            out.push_back(placeholder_embedding(dims));
            ++failed;
        }
    }
    if (failed > 0) {
        std::cerr << "[embedder] " << failed << " of " << out.size() << " " << kind
                  << " could not be encoded, using placeholders\n";
    }
    return out;
}

std::vector<Embedding> HttpEmbedder::encode_texts(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    return finish(encode_all("/embed/text", texts), "texts");
}

std::vector<Embedding> HttpEmbedder::encode_images(const std::vector<std::string>& paths) {
    if (paths.empty()) return {};

    // Unreadable files never reach the server
    std::vector<std::string> payloads;
    std::vector<size_t> positions;
    payloads.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); ++i) {
        std::string bytes;
        if (!read_file(paths[i], bytes) || bytes.empty()) {
            std::cerr << "[embedder] Cannot read image: " << paths[i] << "\n";
            continue;
        }
        payloads.push_back(base64_encode(
            reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size()));
        positions.push_back(i);
    }

    auto encoded = encode_all("/embed/image", payloads);

    std::vector<std::optional<Embedding>> slots(paths.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        slots[positions[i]] = std::move(encoded[i]);
    }
    return finish(std::move(slots), "images");
}

} // namespace lookbook
