#include <catch2/catch.hpp>
#include <gitsnip/selector.hpp>

using namespace gitsnip;

TEST_CASE("no flags selects the default branch", "[selector]") {
    auto r = Selector::from_flags(std::nullopt, std::nullopt, std::nullopt);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == Selector::DefaultBranch);
    REQUIRE(std::string(r.value().kind_name()) == "branch");
}

TEST_CASE("single flag selects its kind", "[selector]") {
    auto b = Selector::from_flags(std::string("dev"), std::nullopt, std::nullopt);
    REQUIRE(b.value() == Selector::branch("dev"));

    auto t = Selector::from_flags(std::nullopt, std::string("v1.2"), std::nullopt);
    REQUIRE(t.value() == Selector::tag("v1.2"));
    REQUIRE(std::string(t.value().kind_name()) == "tag");

    auto c = Selector::from_flags(std::nullopt, std::nullopt, std::string("abc123"));
    REQUIRE(c.value().kind == Selector::Commit);
    REQUIRE(c.value().value == "abc123");
    REQUIRE(std::string(c.value().kind_name()) == "commit");
}

TEST_CASE("two or more flags are a validation error", "[selector]") {
    const std::optional<std::string> some = std::string("x");
    const std::optional<std::string> none;

    auto bt = Selector::from_flags(some, some, none);
    auto bc = Selector::from_flags(some, none, some);
    auto tc = Selector::from_flags(none, some, some);
    auto all = Selector::from_flags(some, some, some);

    for (const auto* r : {&bt, &bc, &tc, &all}) {
        REQUIRE(r->is_err());
        REQUIRE(r->error().code == SnipError::Validation);
    }
}

TEST_CASE("empty flag value is a validation error", "[selector]") {
    auto r = Selector::from_flags(std::string(""), std::nullopt, std::nullopt);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SnipError::Validation);
}

TEST_CASE("full ref names are shortened", "[selector]") {
    REQUIRE(Selector::branch("refs/heads/feature/x").value == "feature/x");
    REQUIRE(Selector::tag("refs/tags/v2").value == "v2");
    // Only the matching namespace is stripped
    REQUIRE(Selector::branch("refs/tags/v2").value == "refs/tags/v2");
}

TEST_CASE("describe() for messages", "[selector]") {
    REQUIRE(Selector::tag("v1").describe() == "tag 'v1'");
    REQUIRE(Selector::default_branch().describe() == "default branch");
}

TEST_CASE("is_commit_hash accepts full-length hex ids only", "[selector]") {
    REQUIRE(is_commit_hash(std::string(40, 'a')));
    REQUIRE(is_commit_hash("0123456789ABCDEF0123456789abcdef01234567"));
    REQUIRE(is_commit_hash(std::string(64, 'f')));
    REQUIRE_FALSE(is_commit_hash("abc123"));
    REQUIRE_FALSE(is_commit_hash(std::string(39, 'a')));
    REQUIRE_FALSE(is_commit_hash(std::string(39, 'a') + "g"));
    REQUIRE_FALSE(is_commit_hash(""));
}
