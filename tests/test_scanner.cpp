#include <catch2/catch.hpp>
#include <dotkeep/toml/scanner.hpp>

using namespace dotkeep;

static TomlLayout scan_ok(const std::string& text) {
    auto r = scan_toml(text);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

// ===== Segmentation =====

TEST_CASE("scan splits tables and entries", "[scanner]") {
    auto layout = scan_ok(
        "title = \"dots\"\n"
        "\n"
        "# tracked repositories\n"
        "[repos.vim]\n"
        "target = \"/home/ann\"\n");

    REQUIRE(layout.tables.size() == 2);
    REQUIRE(layout.tables[0].key.empty());
    REQUIRE(layout.tables[0].entries.size() == 1);
    REQUIRE(layout.tables[0].entries[0].text == "title = \"dots\"\n");

    const auto& repo = layout.tables[1];
    REQUIRE(repo.decor == "\n# tracked repositories\n");
    REQUIRE(repo.header == "[repos.vim]\n");
    REQUIRE(key_names(repo.key) == std::vector<std::string>{"repos", "vim"});
    REQUIRE(repo.entries.size() == 1);
    REQUIRE(key_names(repo.entries[0].key) == std::vector<std::string>{"target"});
}

TEST_CASE("scan keeps a leading byte-order mark apart", "[scanner]") {
    const std::string text = "\xEF\xBB\xBF[repos.vim]\ntarget = \"x\"\n";
    auto layout = scan_ok(text);

    REQUIRE(layout.bom == "\xEF\xBB\xBF");
    REQUIRE(layout.tables.size() == 2);
    REQUIRE(layout.tables[1].decor.empty());
    REQUIRE(layout.tables[1].header == "[repos.vim]\n");
    REQUIRE(layout.render() == text);

    // Columns count from after the mark
    auto bad = scan_toml("\xEF\xBB\xBF= 1\n");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().line == 1);
    REQUIRE(bad.error().column == 1);
}

TEST_CASE("scan keeps trailing trivia in the trailer", "[scanner]") {
    auto layout = scan_ok("[hooks]\n\n# end of file\n");
    REQUIRE(layout.tables.size() == 2);
    REQUIRE(layout.trailer == "\n# end of file\n");
}

TEST_CASE("scan handles multi-line values", "[scanner]") {
    std::string text =
        "[hooks]\n"
        "bootstrap = [\n"
        "    # first the plugins\n"
        "    { post = \"vim_plug.sh\" },\n"
        "    { pre = \"check.sh\", workdir = \"~\" },\n"
        "]\n"
        "notes = \"\"\"\n"
        "a = [not a table]\n"
        "\"\"\"\n";
    auto layout = scan_ok(text);

    REQUIRE(layout.tables.size() == 2);
    REQUIRE(layout.tables[1].entries.size() == 2);
    REQUIRE(layout.tables[1].entries[1].text == "notes = \"\"\"\na = [not a table]\n\"\"\"\n");
    REQUIRE(layout.render() == text);
}

TEST_CASE("scan decodes quoted and dotted keys", "[scanner]") {
    auto layout = scan_ok(
        "[repos.\"my dots\"]\n"
        "bootstrap.os = 'unix'\n"
        "[[servers]]\n");

    REQUIRE(key_names(layout.tables[1].key) == std::vector<std::string>{"repos", "my dots"});
    REQUIRE(key_names(layout.tables[1].entries[0].key) ==
            std::vector<std::string>{"bootstrap", "os"});
    REQUIRE(layout.tables[2].is_array);
}

TEST_CASE("render reproduces the input byte for byte", "[scanner]") {
    std::string text =
        "# dotkeep configuration\n"
        "\n"
        "[repos]   # all repositories\n"
        "vim = { target = \"~\" }\n"
        "\n"
        "[repos.zsh]\n"
        "  branch   =   'main'   # default\n"
        "when = 1979-05-27 07:32:00Z\n"
        "\n"
        "\n"
        "[hooks]\n"
        "commit = [ { pre = \"lint.sh\" } ]\n"
        "\n";
    REQUIRE(scan_ok(text).render() == text);
}

TEST_CASE("render handles a missing final newline", "[scanner]") {
    std::string text = "[repos.vim]\ntarget = \"x\"";
    REQUIRE(scan_ok(text).render() == text);
}

// ===== Errors =====

TEST_CASE("scan reports position of a missing '='", "[scanner]") {
    auto r = scan_toml("[repos]\nvim target\n", "config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DotkeepError::Parse);
    REQUIRE(r.error().file == "config.toml");
    REQUIRE(r.error().line == 2);
}

TEST_CASE("scan rejects an unterminated table header", "[scanner]") {
    auto r = scan_toml("[repos\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DotkeepError::Parse);
}

// ===== Key helpers =====

TEST_CASE("format_key quotes only when needed", "[scanner]") {
    REQUIRE(format_key("vim") == "vim");
    REQUIRE(format_key("my-dots_2") == "my-dots_2");
    REQUIRE(format_key("my dots") == "\"my dots\"");
    REQUIRE(format_key("a.b") == "\"a.b\"");
    REQUIRE(format_key("") == "\"\"");
}

TEST_CASE("quote_string escapes control characters", "[scanner]") {
    REQUIRE(quote_string("C:\\dots") == "\"C:\\\\dots\"");
    REQUIRE(quote_string("say \"hi\"\n") == "\"say \\\"hi\\\"\\n\"");
    REQUIRE(quote_string(std::string(1, '\x01')) == "\"\\u0001\"");
}

TEST_CASE("rename_key_segment rewrites one segment in place", "[scanner]") {
    auto layout = scan_ok("[repos.vim.bootstrap]   # keep me\n");
    auto& table = layout.tables[1];

    rename_key_segment(table.header, table.key, 1, "neo vim");
    REQUIRE(table.header == "[repos.\"neo vim\".bootstrap]   # keep me\n");
    REQUIRE(key_names(table.key) == std::vector<std::string>{"repos", "neo vim", "bootstrap"});

    // Later offsets were shifted
    const auto& last = table.key[2];
    REQUIRE(table.header.substr(last.offset, last.length) == "bootstrap");
}
