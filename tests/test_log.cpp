#include <catch2/catch.hpp>
#include <dotkeep/log.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace dotkeep::log;

// Capture log output written while `fn` runs
static std::string capture_log(const std::function<void()>& fn) {
    std::FILE* tmp = std::tmpfile();
    REQUIRE(tmp != nullptr);

    set_output(tmp);
    fn();
    std::fflush(tmp);
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
    for (auto lvl : {Trace, Debug, Info, Warn, Error}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("level_name() returns correct strings", "[log]") {
    REQUIRE(std::string(level_name(Trace)) == "trace");
    REQUIRE(std::string(level_name(Debug)) == "debug");
    REQUIRE(std::string(level_name(Info)) == "info");
    REQUIRE(std::string(level_name(Warn)) == "warn");
    REQUIRE(std::string(level_name(Error)) == "error");
}

TEST_CASE("parse_level accepts names case-insensitively", "[log]") {
    REQUIRE(parse_level("DEBUG") == Debug);
    REQUIRE(parse_level("warning") == Warn);
    REQUIRE(parse_level("warn") == Warn);
    REQUIRE_FALSE(parse_level("verbose").has_value());
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Messages at or above threshold are emitted", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_log([] {
        warn("hook '%s' exited with status %d", "vim_plug.sh", 2);
        error("giving up");
    });
    REQUIRE(output.find("warn: hook 'vim_plug.sh' exited with status 2\n") != std::string::npos);
    REQUIRE(output.find("error: giving up\n") != std::string::npos);

    set_level(Info);
}

TEST_CASE("Colored prefix when color is enabled", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_log([] { info("hello"); });
    REQUIRE(output.find("\033[32minfo\033[0m: hello") != std::string::npos);

    set_color_enabled(false);
}

TEST_CASE("block() indents every line of the body", "[log]") {
    set_level(Debug);
    set_color_enabled(false);

    auto output = capture_log([] { block(Debug, "stdout of 'a.sh'", "one\ntwo\n"); });
    REQUIRE(output == "debug: stdout of 'a.sh'\n    | one\n    | two\n");

    set_level(Info);
}

TEST_CASE("block() skips empty bodies and filtered levels", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    auto output = capture_log([] {
        block(Info, "empty", "");
        block(Debug, "filtered", "text\n");
    });
    REQUIRE(output.empty());
}
