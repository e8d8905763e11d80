#include <catch2/catch.hpp>
#include <gitsnip/key.hpp>
#include <gitsnip/sha256.hpp>

using namespace gitsnip;

TEST_CASE("short_hash is the first 8 hex digits of SHA-256", "[key]") {
    REQUIRE(short_hash("abc") == "ba7816bf");
    REQUIRE(short_hash("abc").size() == 8);
}

TEST_CASE("base_name takes the final path component", "[key]") {
    REQUIRE(base_name("src/lib.txt") == "lib.txt");
    REQUIRE(base_name("README.md") == "README.md");
    REQUIRE(base_name("a/b/c/main.rs") == "main.rs");
}

TEST_CASE("base_name falls back to unknown", "[key]") {
    REQUIRE(base_name("") == "unknown");
    REQUIRE(base_name("src/") == "unknown");
    REQUIRE(base_name("src/..") == "unknown");
    REQUIRE(base_name(".") == "unknown");
}

TEST_CASE("derive_key layout", "[key]") {
    const std::string url = "https://example.com/repo.git";
    auto key = derive_key(url, "branch", "main", "src/lib.txt");

    std::string expected = SHA256::short_hex(url) + "-" +
                           SHA256::short_hex("branch-main") + "-" +
                           SHA256::short_hex("src/lib.txt") + "-lib.txt";
    REQUIRE(key == expected);
}

TEST_CASE("derive_key is deterministic", "[key]") {
    auto a = derive_key("https://example.com/r.git", "tag", "v1.0", "docs/x.md");
    auto b = derive_key("https://example.com/r.git", "tag", "v1.0", "docs/x.md");
    REQUIRE(a == b);
}

TEST_CASE("derive_key changes with every input", "[key]") {
    auto base = derive_key("https://example.com/r.git", "branch", "main", "src/a.rs");

    REQUIRE(derive_key("https://example.com/other.git", "branch", "main", "src/a.rs") != base);
    REQUIRE(derive_key("https://example.com/r.git", "tag", "main", "src/a.rs") != base);
    REQUIRE(derive_key("https://example.com/r.git", "branch", "dev", "src/a.rs") != base);
    // Same base name, different directory
    REQUIRE(derive_key("https://example.com/r.git", "branch", "main", "lib/a.rs") != base);
}

TEST_CASE("derive_key uses unknown for paths without a file name", "[key]") {
    auto key = derive_key("u", "commit", "abc", "dir/");
    REQUIRE(key.size() > 8);
    REQUIRE(key.substr(key.size() - 8) == "-unknown");
}
