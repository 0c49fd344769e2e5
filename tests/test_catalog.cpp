#include <catch2/catch.hpp>
#include "catalog/catalog.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <unistd.h>

using namespace lookbook;

struct CatalogFixture {
    std::string dir = "/tmp/lookbook_test_catalog_" + std::to_string(getpid());
    std::string images = dir + "/images";
    std::string csv = dir + "/styles.csv";

    CatalogFixture() {
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(images + "/nested");
        touch(images + "/b.jpg");
        touch(images + "/a.PNG");
        touch(images + "/nested/c.webp");
        touch(images + "/notes.txt");
        std::ofstream out(csv);
        out << "image,caption,season\n"
            << "a.PNG,\"Women Apparel Dress, red\",Summer\n"
            << "b.jpg,Men Footwear Boots,Winter\n"
            << "b.jpg,Duplicate row,Winter\n"
            << "\n"
            << "short\n";
    }
    ~CatalogFixture() { std::filesystem::remove_all(dir); }

    static void touch(const std::string& path) {
        std::ofstream out(path);
        out << "x";
    }
};

// ── CSV parsing ──────────────────────────────────────────────

TEST_CASE("parse_csv_line: plain fields", "[catalog]") {
    REQUIRE(parse_csv_line("a,b,c") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(parse_csv_line("a,,c") == std::vector<std::string>{"a", "", "c"});
    REQUIRE(parse_csv_line("") == std::vector<std::string>{""});
}

TEST_CASE("parse_csv_line: quoted fields", "[catalog]") {
    auto fields = parse_csv_line("1.jpg,\"Red, long \"\"maxi\"\" dress\",x\r");
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[1] == "Red, long \"maxi\" dress");
    REQUIRE(fields[2] == "x");
}

TEST_CASE("read_captions_csv: reads image and caption columns", "[catalog]") {
    CatalogFixture f;
    auto rows = read_captions_csv(f.csv);
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].image == "a.PNG");
    REQUIRE(rows[0].caption == "Women Apparel Dress, red");
    REQUIRE(rows[1].caption == "Men Footwear Boots");
}

TEST_CASE("read_captions_csv: missing file or columns yield nothing", "[catalog]") {
    CatalogFixture f;
    REQUIRE(read_captions_csv(f.dir + "/missing.csv").empty());

    std::string other = f.dir + "/other.csv";
    {
        std::ofstream out(other);
        out << "file,text\n1.jpg,hello\n";
    }
    REQUIRE(read_captions_csv(other).empty());
}

// ── Catalog ──────────────────────────────────────────────────

TEST_CASE("Catalog: scan collects images recursively, sorted", "[catalog]") {
    CatalogFixture f;
    auto cat = Catalog::scan(f.images, f.csv);

    const auto& paths = cat.image_paths();
    REQUIRE(paths.size() == 3);
    REQUIRE(std::is_sorted(paths.begin(), paths.end()));
    for (const auto& p : paths) {
        REQUIRE(std::filesystem::path(p).is_absolute());
        REQUIRE(Catalog::is_image_file(p));
    }
}

TEST_CASE("Catalog: caption lookup by file name", "[catalog]") {
    CatalogFixture f;
    auto cat = Catalog::scan(f.images, f.csv);
    REQUIRE(cat.caption_for(f.images + "/b.jpg") == "Men Footwear Boots");
    REQUIRE(cat.caption_for("b.jpg") == "Men Footwear Boots");
    REQUIRE(cat.caption_for(f.images + "/nested/c.webp").empty());
}

TEST_CASE("Catalog: missing inputs give an empty catalog", "[catalog]") {
    auto cat = Catalog::scan("/tmp/lookbook_no_such_images", "/tmp/lookbook_no_such.csv");
    REQUIRE(cat.empty());
    REQUIRE(cat.captioned_items().empty());
}

TEST_CASE("Catalog: is_image_file checks known extensions", "[catalog]") {
    REQUIRE(Catalog::is_image_file("x.jpeg"));
    REQUIRE(Catalog::is_image_file("x.TIFF"));
    REQUIRE(Catalog::is_image_file("x.gif"));
    REQUIRE_FALSE(Catalog::is_image_file("x.svg"));
    REQUIRE_FALSE(Catalog::is_image_file("jpg"));
}

TEST_CASE("Catalog: random_sample draws distinct items", "[catalog]") {
    Catalog cat({"1", "2", "3", "4", "5"}, {});
    std::mt19937 rng(42);

    auto sample = cat.random_sample(3, rng);
    REQUIRE(sample.size() == 3);
    REQUIRE(std::set<std::string>(sample.begin(), sample.end()).size() == 3);

    REQUIRE(cat.random_sample(50, rng).size() == 5);
    REQUIRE(cat.random_sample(0, rng).empty());
}
