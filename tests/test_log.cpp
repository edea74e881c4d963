#include <catch2/catch.hpp>
#include <globstar/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace globstar::log;

// Run `fn` with log output redirected to a temporary file; return what it wrote.
static std::string capture_log(std::function<void()> fn) {
    std::FILE* tmp = std::tmpfile();
    if (!tmp) return "<no tmpfile>";
    set_output(tmp);
    fn();
    set_output(nullptr);

    std::string output;
    std::rewind(tmp);
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), tmp)) > 0) {
        output.append(buf, n);
    }
    std::fclose(tmp);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    set_level(Trace);
    REQUIRE(get_level() == Trace);
    set_level(Error);
    REQUIRE(get_level() == Error);
    set_level(Info);
}

TEST_CASE("enabled() follows the threshold", "[log]") {
    set_level(Debug);
    REQUIRE_FALSE(enabled(Trace));
    REQUIRE(enabled(Debug));
    REQUIRE(enabled(Error));
    set_level(Info);
    REQUIRE_FALSE(enabled(Debug));
}

TEST_CASE("parse_level accepts level names", "[log]") {
    Level lvl = Info;
    REQUIRE(parse_level("debug", lvl));
    REQUIRE(lvl == Debug);
    REQUIRE(parse_level("error", lvl));
    REQUIRE(lvl == Error);
    REQUIRE_FALSE(parse_level("verbose", lvl));
    REQUIRE(lvl == Error);
}

TEST_CASE("level_name() and parse_level() agree", "[log]") {
    for (Level l : {Trace, Debug, Info, Warn, Error}) {
        Level parsed;
        REQUIRE(parse_level(level_name(l), parsed));
        REQUIRE(parsed == l);
    }
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);
    auto output = capture_log([] { debug("skipping directory: %s", "x"); });
    REQUIRE(output.empty());
    set_level(Info);
}

TEST_CASE("Messages at threshold are emitted with level prefix", "[log]") {
    set_level(Debug);
    set_color_enabled(false);
    auto output = capture_log([] {
        debug("skipping directory: %s", "a/b");
        error("bad pattern %d", 3);
    });
    REQUIRE(output == "debug: skipping directory: a/b\nerror: bad pattern 3\n");
    set_level(Info);
}

TEST_CASE("Color wraps the level name", "[log]") {
    set_level(Info);
    set_color_enabled(true);
    auto output = capture_log([] { warn("careful"); });
    REQUIRE(output == "\033[33mwarn\033[0m: careful\n");
    set_color_enabled(false);
}
