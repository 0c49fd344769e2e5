#pragma once
#include "../catalog/catalog.hpp"
#include "../embedder.hpp"
#include "../index/index_slot.hpp"
#include "../partition/partition_registry.hpp"
#include <memory>
#include <string>

namespace lookbook {

// Owns the global image index, the caption index and the partition
// registry, and their on-disk copies under one directory.
class IndexManager {
public:
    static constexpr const char* kImageIndexFile = "image_index.idx";
    static constexpr const char* kCaptionIndexFile = "caption_index.idx";

    IndexManager(std::string index_dir, PartitionRuleTable rules,
                 EmbeddingProvider& embedder, const Catalog& catalog);

    // Load whatever is on disk; rebuild and save what is missing or corrupt.
    // Partitions are rebuilt whenever the image index is.
    void load_or_build();

    // Encode and build every index off to the side, save, then publish
    void rebuild();

    std::shared_ptr<const SimilarityIndex> image_index() const { return image_.get(); }
    std::shared_ptr<const SimilarityIndex> caption_index() const { return caption_.get(); }
    const IndexSlot& image_slot() const { return image_; }
    const IndexSlot& caption_slot() const { return caption_; }
    const PartitionRegistry& partitions() const { return partitions_; }

    const std::string& index_dir() const { return index_dir_; }

private:
    std::shared_ptr<const SimilarityIndex> build_image_index();
    std::shared_ptr<const SimilarityIndex> build_caption_index();
    std::vector<LabeledItem> partition_items(const SimilarityIndex& image_index) const;
    std::shared_ptr<const SimilarityIndex> try_load(const std::string& file) const;
    std::string path_of(const std::string& file) const;

    std::string index_dir_;
    EmbeddingProvider& embedder_;
    const Catalog& catalog_;
    IndexSlot image_;
    IndexSlot caption_;
    PartitionRegistry partitions_;
};

} // namespace lookbook
