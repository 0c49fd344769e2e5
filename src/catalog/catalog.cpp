#include "catalog.hpp"
#include "../util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <unordered_set>

namespace lookbook {

namespace {

const std::vector<std::string> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"
};

int column_of(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (to_lower(trim(header[i])) == name) return static_cast<int>(i);
    }
    return -1;
}

} // namespace

std::vector<std::string> parse_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

std::vector<CaptionRow> read_captions_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};

    std::string line;
    if (!std::getline(file, line)) return {};
    auto header = parse_csv_line(line);
    int image_col = column_of(header, "image");
    int caption_col = column_of(header, "caption");
    if (image_col < 0 || caption_col < 0) {
        std::cerr << "[catalog] " << path << " has no image/caption columns\n";
        return {};
    }

    std::vector<CaptionRow> rows;
    std::unordered_set<std::string> seen;
    const auto need = static_cast<size_t>(std::max(image_col, caption_col));
    while (std::getline(file, line)) {
        if (trim(line).empty()) continue;
        auto fields = parse_csv_line(line);
        if (fields.size() <= need) continue;
        std::string image = trim(fields[static_cast<size_t>(image_col)]);
        if (image.empty() || !seen.insert(image).second) continue;
        rows.push_back({image, trim(fields[static_cast<size_t>(caption_col)])});
    }
    return rows;
}

Catalog::Catalog(std::vector<std::string> image_paths, std::vector<CaptionRow> captions)
    : image_paths_(std::move(image_paths)), captions_(std::move(captions))
{
    for (size_t i = 0; i < captions_.size(); ++i) {
        by_name_.emplace(base_name(captions_[i].image), i);
    }
}

bool Catalog::is_image_file(const std::string& path) {
    for (const auto& ext : kImageExtensions) {
        if (ends_with_ci(path, ext)) return true;
    }
    return false;
}

Catalog Catalog::scan(const std::string& image_dir, const std::string& captions_csv) {
    std::vector<std::string> paths;
    std::error_code ec;
    if (std::filesystem::is_directory(image_dir, ec)) {
        auto it = std::filesystem::recursive_directory_iterator(image_dir, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            std::string p = it->path().string();
            if (!is_image_file(p)) continue;
            paths.push_back(std::filesystem::absolute(it->path()).lexically_normal().string());
        }
        if (ec) {
            std::cerr << "[catalog] Scan of " << image_dir << " stopped: " << ec.message() << "\n";
        }
    } else {
        std::cerr << "[catalog] Image folder not found: " << image_dir << "\n";
    }
    std::sort(paths.begin(), paths.end());

    return Catalog(std::move(paths), read_captions_csv(captions_csv));
}

std::string Catalog::caption_for(const std::string& id) const {
    auto it = by_name_.find(base_name(id));
    if (it == by_name_.end()) return "";
    return captions_[it->second].caption;
}

std::vector<std::string> Catalog::random_sample(size_t n, std::mt19937& rng) const {
    std::vector<std::string> out;
    std::sample(image_paths_.begin(), image_paths_.end(), std::back_inserter(out),
                std::min(n, image_paths_.size()), rng);
    std::shuffle(out.begin(), out.end(), rng);
    return out;
}

} // namespace lookbook
