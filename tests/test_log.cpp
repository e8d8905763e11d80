#include <catch2/catch.hpp>
#include <gitsnip/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

#include <unistd.h>

using namespace gitsnip::log;

// Capture everything written to stderr while fn runs
static std::string capture_stderr(const std::function<void()>& fn) {
    std::fflush(stderr);
    int saved = dup(fileno(stderr));
    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved, fileno(stderr));
    close(saved);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts level names in any case", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("DEBUG", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("warning", lvl));
    REQUIRE(lvl == Warn);
    REQUIRE(parse_level("trace", lvl));
    REQUIRE(lvl == Trace);
}

TEST_CASE("parse_level rejects unknown names", "[log]") {
    Level lvl = Info;
    REQUIRE_FALSE(parse_level("loud", lvl));
    REQUIRE_FALSE(parse_level("", lvl));
    REQUIRE(lvl == Info);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { info("fetching %s", "repo"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] {
        warn("snippet %s is stale", "abc");
        error("fetch failed");
    });
    REQUIRE(output.find("warn: snippet abc is stale\n") != std::string::npos);
    REQUIRE(output.find("error: fetch failed\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Color codes only when enabled", "[log]") {
    set_level(Info);

    set_color_enabled(true);
    auto colored = capture_stderr([] { info("x"); });
    REQUIRE(colored.find("\033[") != std::string::npos);

    set_color_enabled(false);
    auto plain = capture_stderr([] { info("x"); });
    REQUIRE(plain == "info: x\n");
}
