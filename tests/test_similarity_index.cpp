#include <catch2/catch.hpp>
#include "index/flat_index.hpp"
#include "index/index_slot.hpp"
#include "index/similarity_index.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <filesystem>
#include <limits>
#include <unistd.h>

using namespace lookbook;

static Embedding unit(std::initializer_list<float> values) {
    Embedding v(values);
    l2_normalize(v);
    return v;
}

static std::vector<IndexedItem> sample_items() {
    return {
        {"a.jpg", unit({1.0f, 0.0f, 0.0f})},
        {"b.jpg", unit({0.8f, 0.6f, 0.0f})},
        {"c.jpg", unit({0.0f, 1.0f, 0.0f})},
        {"d.jpg", unit({0.0f, 0.0f, 1.0f})},
    };
}

// ── build ────────────────────────────────────────────────────

TEST_CASE("SimilarityIndex: build keeps order and dimension", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    REQUIRE(index.size() == 4);
    REQUIRE(index.dim() == 3);
    REQUIRE(index.ids() == std::vector<std::string>{"a.jpg", "b.jpg", "c.jpg", "d.jpg"});
    REQUIRE(index.vector(1) == sample_items()[1].vector);
    REQUIRE(index.vector(99).empty());
}

TEST_CASE("SimilarityIndex: empty input rejected", "[index]") {
    REQUIRE_THROWS_AS(SimilarityIndex::build({}), EmptyInputError);
}

TEST_CASE("SimilarityIndex: mismatched dimensions rejected", "[index]") {
    std::vector<IndexedItem> items = {
        {"a", {1.0f, 0.0f}},
        {"b", {1.0f, 0.0f, 0.0f}},
    };
    REQUIRE_THROWS_AS(SimilarityIndex::build(items), DimensionMismatchError);
}

TEST_CASE("SimilarityIndex: zero-width vectors rejected", "[index]") {
    std::vector<IndexedItem> items = {{"a", {}}};
    REQUIRE_THROWS_AS(SimilarityIndex::build(items), DimensionMismatchError);
}

TEST_CASE("SimilarityIndex: duplicate identifiers rejected", "[index]") {
    std::vector<IndexedItem> items = {
        {"a", {1.0f, 0.0f}},
        {"a", {0.0f, 1.0f}},
    };
    REQUIRE_THROWS_AS(SimilarityIndex::build(items), DuplicateIdentifierError);
}

TEST_CASE("SimilarityIndex: all build errors derive from IndexError", "[index]") {
    REQUIRE_THROWS_AS(SimilarityIndex::build({}), IndexError);
}

// ── search ───────────────────────────────────────────────────

TEST_CASE("SimilarityIndex: search ranks by inner product", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    auto hits = index.search(unit({1.0f, 0.0f, 0.0f}), 3);

    REQUIRE(hits.size() == 3);
    REQUIRE(hits[0].id == "a.jpg");
    REQUIRE(std::abs(hits[0].score - 1.0f) < 1e-5f);
    REQUIRE(hits[1].id == "b.jpg");
    REQUIRE(std::abs(hits[1].score - 0.8f) < 1e-5f);
    for (size_t i = 1; i < hits.size(); ++i) {
        REQUIRE(hits[i - 1].score >= hits[i].score);
    }
}

TEST_CASE("SimilarityIndex: k larger than size returns everything", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    REQUIRE(index.search(unit({0.0f, 1.0f, 0.0f}), 100).size() == 4);
}

TEST_CASE("SimilarityIndex: non-positive k returns nothing", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    REQUIRE(index.search(unit({1.0f, 0.0f, 0.0f}), 0).empty());
    REQUIRE(index.search(unit({1.0f, 0.0f, 0.0f}), -1).empty());
}

TEST_CASE("SimilarityIndex: wrong query width returns nothing", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    REQUIRE(index.search({1.0f, 0.0f}, 2).empty());
}

TEST_CASE("SimilarityIndex: ties keep insertion order", "[index]") {
    std::vector<IndexedItem> items = {
        {"first", {0.0f, 1.0f}},
        {"second", {0.0f, 1.0f}},
        {"third", {0.0f, 1.0f}},
    };
    auto index = SimilarityIndex::build(items);
    auto hits = index.search({0.0f, 1.0f}, 3);
    REQUIRE(hits.size() == 3);
    REQUIRE(hits[0].id == "first");
    REQUIRE(hits[1].id == "second");
    REQUIRE(hits[2].id == "third");
}

// ── serialization ────────────────────────────────────────────

TEST_CASE("SimilarityIndex: deserialize reproduces search results", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    auto copy = SimilarityIndex::deserialize(index.serialize());

    REQUIRE(copy.ids() == index.ids());
    REQUIRE(copy.dim() == index.dim());
    auto q = unit({0.3f, 0.5f, 0.2f});
    auto a = index.search(q, 4);
    auto b = copy.search(q, 4);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].id == b[i].id);
        REQUIRE(a[i].score == b[i].score);
    }
}

TEST_CASE("SimilarityIndex: blob is a MessagePack map", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    auto bytes = index.serialize();
    auto blob = nlohmann::json::from_msgpack(bytes);
    REQUIRE(blob.is_object());
    REQUIRE(blob["ids"].size() == 4);
    REQUIRE(blob["dim"] == 3);
    REQUIRE(blob["index"].is_binary());
    REQUIRE(blob["vectors"].is_binary());
    REQUIRE(blob["vectors"].get_binary().size() == 4 * 3 * sizeof(float));
}

TEST_CASE("SimilarityIndex: garbage bytes are corrupt", "[index]") {
    REQUIRE_THROWS_AS(SimilarityIndex::deserialize("definitely not msgpack"), CorruptIndexError);
    REQUIRE_THROWS_AS(SimilarityIndex::deserialize(""), CorruptIndexError);
}

TEST_CASE("SimilarityIndex: blob without ids is corrupt", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    auto blob = nlohmann::json::from_msgpack(index.serialize());
    blob.erase("ids");
    auto bytes = nlohmann::json::to_msgpack(blob);
    REQUIRE_THROWS_AS(SimilarityIndex::deserialize(std::string(bytes.begin(), bytes.end())),
                      CorruptIndexError);
}

TEST_CASE("SimilarityIndex: id count must match index rows", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    auto blob = nlohmann::json::from_msgpack(index.serialize());
    blob["ids"].erase(blob["ids"].size() - 1);
    auto bytes = nlohmann::json::to_msgpack(blob);
    REQUIRE_THROWS_AS(SimilarityIndex::deserialize(std::string(bytes.begin(), bytes.end())),
                      CorruptIndexError);
}

TEST_CASE("SimilarityIndex: unknown extra keys are tolerated", "[index]") {
    auto index = SimilarityIndex::build(sample_items());
    auto blob = nlohmann::json::from_msgpack(index.serialize());
    blob["built_by"] = "someone";
    blob.erase("vectors");
    auto bytes = nlohmann::json::to_msgpack(blob);
    auto copy = SimilarityIndex::deserialize(std::string(bytes.begin(), bytes.end()));
    REQUIRE(copy.size() == 4);
}

TEST_CASE("FlatIpIndex: truncated payload is corrupt", "[index]") {
    FlatIpIndex flat(2);
    float rows[] = {1.0f, 0.0f, 0.0f, 1.0f};
    flat.add(rows, 2);
    auto payload = flat.serialize();
    REQUIRE(FlatIpIndex::deserialize(payload).size() == 2);
    payload.pop_back();
    REQUIRE_THROWS_AS(FlatIpIndex::deserialize(payload), CorruptIndexError);
    REQUIRE_THROWS_AS(FlatIpIndex::deserialize("LBF"), CorruptIndexError);
}

TEST_CASE("FlatIpIndex: NaN rows rank after every finite score", "[index]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    FlatIpIndex flat(2);
    float rows[] = {nan, 0.0f, 0.0f, 1.0f, nan, nan, 1.0f, 0.0f, 0.5f, 0.5f};
    flat.add(rows, 5);

    float query[] = {1.0f, 0.0f};
    auto top = flat.search(query, 2, 5);
    REQUIRE(top.size() == 5);
    REQUIRE(top[0].first == 3);
    REQUIRE(top[1].first == 4);
    REQUIRE(top[2].first == 1);
    REQUIRE(top[3].first == 0);
    REQUIRE(top[4].first == 2);

    auto best = flat.search(query, 2, 1);
    REQUIRE(best.size() == 1);
    REQUIRE(best[0].first == 3);
}

// ── save / load ──────────────────────────────────────────────

TEST_CASE("SimilarityIndex: save and load through a file", "[index]") {
    std::string dir = "/tmp/lookbook_test_index_" + std::to_string(getpid());
    std::string path = dir + "/image_index.idx";

    auto index = SimilarityIndex::build(sample_items());
    index.save(path);
    auto loaded = SimilarityIndex::load(path);
    REQUIRE(loaded.ids() == index.ids());

    std::filesystem::remove_all(dir);
}

TEST_CASE("SimilarityIndex: load of a missing file throws", "[index]") {
    REQUIRE_THROWS_AS(SimilarityIndex::load("/tmp/lookbook_missing_index.idx"),
                      std::runtime_error);
}

TEST_CASE("SimilarityIndex: load of a corrupt file throws CorruptIndexError", "[index]") {
    std::string path = "/tmp/lookbook_test_corrupt_" + std::to_string(getpid()) + ".idx";
    REQUIRE(atomic_write_file(path, "garbage"));
    REQUIRE_THROWS_AS(SimilarityIndex::load(path), CorruptIndexError);
    std::filesystem::remove(path);
}

// ── IndexSlot ────────────────────────────────────────────────

TEST_CASE("IndexSlot: readers keep the generation they took", "[index]") {
    IndexSlot slot;
    REQUIRE(slot.search({1.0f, 0.0f, 0.0f}, 3).empty());

    slot.publish(std::make_shared<const SimilarityIndex>(SimilarityIndex::build(sample_items())));
    auto held = slot.get();

    std::vector<IndexedItem> next = {{"z.jpg", {1.0f, 0.0f, 0.0f}}};
    slot.publish(std::make_shared<const SimilarityIndex>(SimilarityIndex::build(next)));

    REQUIRE(held->size() == 4);
    REQUIRE(slot.get()->size() == 1);
    REQUIRE(slot.search({1.0f, 0.0f, 0.0f}, 3).front().id == "z.jpg");
}
