#include <catch2/catch.hpp>
#include "util.hpp"
#include <filesystem>
#include <unistd.h>

using namespace lookbook;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t\n hello \r\n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t ").empty());
}

// ── to_lower / ends_with_ci ──────────────────────────────────────

TEST_CASE("to_lower: ascii letters only", "[util]") {
    REQUIRE(to_lower("Men Casual SHOES 42") == "men casual shoes 42");
}

TEST_CASE("ends_with_ci: matches regardless of case", "[util]") {
    REQUIRE(ends_with_ci("photo.JPG", ".jpg"));
    REQUIRE(ends_with_ci("photo.jpeg", ".JPEG"));
    REQUIRE_FALSE(ends_with_ci("photo.jpg.txt", ".jpg"));
    REQUIRE_FALSE(ends_with_ci("jpg", ".jpg"));
}

// ── replace_all ──────────────────────────────────────────────────

TEST_CASE("replace_all: multiple replacements", "[util]") {
    REQUIRE(replace_all("aaa", "a", "bb") == "bbbbbb");
}

TEST_CASE("replace_all: empty from returns original", "[util]") {
    REQUIRE(replace_all("hello", "", "abc") == "hello");
}

// ── base_name ────────────────────────────────────────────────────

TEST_CASE("base_name: strips directories", "[util]") {
    REQUIRE(base_name("/data/images/1163.jpg") == "1163.jpg");
    REQUIRE(base_name("1163.jpg") == "1163.jpg");
    REQUIRE(base_name("dir/") == "");
}

// ── base64_encode ────────────────────────────────────────────────

TEST_CASE("base64_encode: padding cases", "[util]") {
    auto enc = [](const std::string& s) {
        return base64_encode(reinterpret_cast<const unsigned char*>(s.data()), s.size());
    };
    REQUIRE(enc("") == "");
    REQUIRE(enc("f") == "Zg==");
    REQUIRE(enc("fo") == "Zm8=");
    REQUIRE(enc("foo") == "Zm9v");
    REQUIRE(enc("foobar") == "Zm9vYmFy");
}

// ── format_timestamp ─────────────────────────────────────────────

TEST_CASE("format_timestamp: epoch zero", "[util]") {
    REQUIRE(format_timestamp(0) == "1970-01-01T00:00:00Z");
}

TEST_CASE("format_timestamp: known instant", "[util]") {
    REQUIRE(format_timestamp(1700000000) == "2023-11-14T22:13:20Z");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: path without tilde unchanged", "[util]") {
    REQUIRE(expand_home("/usr/local") == "/usr/local");
}

TEST_CASE("expand_home: tilde is expanded", "[util]") {
    std::string result = expand_home("~/Documents");
    REQUIRE(result.find('~') == std::string::npos);
    REQUIRE(result.size() > std::string("/Documents").size());
}

// ── read_file / atomic_write_file ────────────────────────────────

TEST_CASE("atomic_write_file: creates parent directories and replaces content", "[util]") {
    std::string dir = "/tmp/lookbook_test_util_" + std::to_string(getpid());
    std::string path = dir + "/nested/file.bin";

    REQUIRE(atomic_write_file(path, std::string("one\0two", 7)));
    std::string content;
    REQUIRE(read_file(path, content));
    REQUIRE(content == std::string("one\0two", 7));

    REQUIRE(atomic_write_file(path, "three"));
    REQUIRE(read_file(path, content));
    REQUIRE(content == "three");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("read_file: missing file returns false", "[util]") {
    std::string content = "untouched";
    REQUIRE_FALSE(read_file("/tmp/lookbook_no_such_file_" + std::to_string(getpid()), content));
    REQUIRE(content == "untouched");
}
