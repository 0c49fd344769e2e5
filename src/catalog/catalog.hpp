#pragma once
#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace lookbook {

struct CaptionRow {
    std::string image;    // file name as written in the CSV
    std::string caption;
};

// Split one CSV record. Double-quoted fields may contain commas and ""
// escapes.
std::vector<std::string> parse_csv_line(const std::string& line);

// Read the image and caption columns of a CSV with a header row. Rows
// repeating an image name keep the first caption. Missing file -> empty.
std::vector<CaptionRow> read_captions_csv(const std::string& path);

// Image folder plus caption table. Image identifiers are absolute paths.
class Catalog {
public:
    Catalog() = default;
    Catalog(std::vector<std::string> image_paths, std::vector<CaptionRow> captions);

    // Recursive scan of image_dir (sorted) and the caption CSV. Missing
    // inputs leave the matching side empty.
    static Catalog scan(const std::string& image_dir, const std::string& captions_csv);

    static bool is_image_file(const std::string& path);

    const std::vector<std::string>& image_paths() const { return image_paths_; }
    const std::vector<CaptionRow>& captioned_items() const { return captions_; }

    // Looked up by file name; empty when the image has no caption
    std::string caption_for(const std::string& id) const;

    // Up to n distinct image paths
    std::vector<std::string> random_sample(size_t n, std::mt19937& rng) const;

    bool empty() const { return image_paths_.empty(); }

private:
    std::vector<std::string> image_paths_;
    std::vector<CaptionRow> captions_;
    std::unordered_map<std::string, size_t> by_name_;
};

} // namespace lookbook
