#include "index_manager.hpp"
#include <filesystem>
#include <iostream>

namespace lookbook {

namespace {

bool same_partitions(const PartitionMap& a, const PartitionMap& b) {
    if (a.size() != b.size()) return false;
    for (const auto& [key, index] : a) {
        auto it = b.find(key);
        if (it == b.end() || index->ids() != it->second->ids()) return false;
    }
    return true;
}

} // namespace

IndexManager::IndexManager(std::string index_dir, PartitionRuleTable rules,
                           EmbeddingProvider& embedder, const Catalog& catalog)
    : index_dir_(std::move(index_dir))
    , embedder_(embedder)
    , catalog_(catalog)
    , partitions_(std::move(rules))
{}

std::string IndexManager::path_of(const std::string& file) const {
    return (std::filesystem::path(index_dir_) / file).string();
}

std::shared_ptr<const SimilarityIndex> IndexManager::try_load(const std::string& file) const {
    std::string path = path_of(file);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return nullptr;
    try {
        auto index = std::make_shared<const SimilarityIndex>(SimilarityIndex::load(path));
        std::cerr << "[index] Loaded " << file << " (" << index->size() << " items)\n";
        return index;
    } catch (const std::exception& e) {
        std::cerr << "[index] Cannot load " << file << ", rebuilding: " << e.what() << "\n";
        return nullptr;
    }
}

std::shared_ptr<const SimilarityIndex> IndexManager::build_image_index() {
    const auto& paths = catalog_.image_paths();
    if (paths.empty()) {
        std::cerr << "[index] No images in catalog, image index left empty\n";
        return nullptr;
    }

    std::cerr << "[index] Encoding " << paths.size() << " images\n";
    auto vectors = embedder_.encode_images(paths);
    std::vector<IndexedItem> items;
    items.reserve(paths.size());
    for (size_t i = 0; i < paths.size() && i < vectors.size(); ++i) {
        items.push_back({paths[i], std::move(vectors[i])});
    }
    return std::make_shared<const SimilarityIndex>(SimilarityIndex::build(items));
}

std::shared_ptr<const SimilarityIndex> IndexManager::build_caption_index() {
    const auto& rows = catalog_.captioned_items();
    if (rows.empty()) {
        std::cerr << "[index] No captions in catalog, caption index left empty\n";
        return nullptr;
    }

    std::vector<std::string> texts;
    texts.reserve(rows.size());
    for (const auto& row : rows) texts.push_back(row.caption);

    std::cerr << "[index] Encoding " << texts.size() << " captions\n";
    auto vectors = embedder_.encode_texts(texts);
    std::vector<IndexedItem> items;
    items.reserve(rows.size());
    for (size_t i = 0; i < rows.size() && i < vectors.size(); ++i) {
        items.push_back({rows[i].image, std::move(vectors[i])});
    }
    return std::make_shared<const SimilarityIndex>(SimilarityIndex::build(items));
}

std::vector<LabeledItem> IndexManager::partition_items(const SimilarityIndex& image_index) const {
    std::vector<LabeledItem> items;
    items.reserve(image_index.size());
    for (size_t row = 0; row < image_index.size(); ++row) {
        const auto& id = image_index.ids()[row];
        items.push_back({id, image_index.vector(row), catalog_.caption_for(id)});
    }
    return items;
}

void IndexManager::load_or_build() {
    bool image_rebuilt = false;

    auto image = try_load(kImageIndexFile);
    if (!image) {
        image = build_image_index();
        if (image) image->save(path_of(kImageIndexFile));
        image_rebuilt = true;
    }

    auto caption = try_load(kCaptionIndexFile);
    if (!caption) {
        caption = build_caption_index();
        if (caption) caption->save(path_of(kCaptionIndexFile));
    }

    image_.publish(image);
    caption_.publish(caption);

    if (!image) {
        partitions_.publish({});
        return;
    }

    // Partitions derive from the image index without encoding, so the files
    // on disk are checked against a fresh grouping
    auto expected = partitions_.build_all(partition_items(*image));
    if (!image_rebuilt) {
        partitions_.load_all(index_dir_);
        if (same_partitions(*partitions_.snapshot(), expected)) {
            std::cerr << "[index] Loaded " << expected.size() << " partitions\n";
            return;
        }
        std::cerr << "[index] Partition files missing or out of date, rebuilding\n";
    }
    PartitionRegistry::save_map(expected, index_dir_);
    partitions_.publish(std::move(expected));
}

void IndexManager::rebuild() {
    auto image = build_image_index();
    auto caption = build_caption_index();
    PartitionMap parts;
    if (image) parts = partitions_.build_all(partition_items(*image));

    if (image) image->save(path_of(kImageIndexFile));
    if (caption) caption->save(path_of(kCaptionIndexFile));
    PartitionRegistry::save_map(parts, index_dir_);

    image_.publish(image);
    caption_.publish(caption);
    partitions_.publish(std::move(parts));
    std::cerr << "[index] Rebuilt " << (image ? image->size() : 0) << " images, "
              << (caption ? caption->size() : 0) << " captions, "
              << partitions_.keys().size() << " partitions\n";
}

} // namespace lookbook
