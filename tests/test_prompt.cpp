#include <catch2/catch.hpp>
#include <dotkeep/prompt.hpp>
#include <sstream>

using namespace dotkeep;

// ===== StreamPrompter =====

TEST_CASE("prompter accepts long and short answers", "[prompt]") {
    for (const char* answer : {"a\n", "accept\n", "Y\n", "yes\n", "  Accept  \n"}) {
        std::istringstream in(answer);
        std::ostringstream out;
        StreamPrompter prompter(in, out);

        auto r = prompter.confirm("Run 'a.sh' at '.'? [a]ccept/[d]eny");
        REQUIRE(r.is_ok());
        REQUIRE(r.value());
        REQUIRE(out.str().find("Run 'a.sh' at '.'? [a]ccept/[d]eny ") == 0);
    }
}

TEST_CASE("prompter refuses on deny", "[prompt]") {
    for (const char* answer : {"d\n", "deny\n", "n\n", "NO\n"}) {
        std::istringstream in(answer);
        std::ostringstream out;
        StreamPrompter prompter(in, out);

        auto r = prompter.confirm("ok?");
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.value());
    }
}

TEST_CASE("prompter asks again on unknown answers", "[prompt]") {
    std::istringstream in("maybe\n\naccept\n");
    std::ostringstream out;
    StreamPrompter prompter(in, out);

    auto r = prompter.confirm("ok?");
    REQUIRE(r.is_ok());
    REQUIRE(r.value());

    // Asked three times
    std::string text = out.str();
    size_t asked = 0;
    for (size_t pos = text.find("ok?"); pos != std::string::npos; pos = text.find("ok?", pos + 1)) {
        ++asked;
    }
    REQUIRE(asked == 3);
}

TEST_CASE("end of input counts as refusal", "[prompt]") {
    std::istringstream in("");
    std::ostringstream out;
    StreamPrompter prompter(in, out);

    auto r = prompter.confirm("ok?");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
}

// ===== Pagers =====

TEST_CASE("stream pager numbers script lines", "[prompt]") {
    std::ostringstream out;
    StreamPager pager(out);

    REQUIRE(pager.page("/cfg/hooks/a.sh", "#!/bin/sh\necho hi\n").is_ok());
    REQUIRE(out.str() ==
        "==> /cfg/hooks/a.sh <==\n"
        "   1 | #!/bin/sh\n"
        "   2 | echo hi\n");
}

TEST_CASE("command pager runs the configured program", "[prompt]") {
    CommandPager ok_pager("true");
    REQUIRE(ok_pager.page("/dev/null", "").is_ok());

    CommandPager failing("false");
    auto s = failing.page("/dev/null", "");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == DotkeepError::Execution);

    CommandPager empty("  ");
    REQUIRE(empty.page("/dev/null", "").error().code == DotkeepError::InvalidArg);
}
