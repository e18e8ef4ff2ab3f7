#include <catch2/catch.hpp>
#include <dotkeep/locator.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>

using namespace dotkeep;
namespace fs = std::filesystem;

// Environment backed by a fixed map
static EnvLookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        const char* src = std::getenv("DOTKEEP_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("dotkeep_locator_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// ===== resolve_config_dir() =====

TEST_CASE("config dir from HOME", "[locator]") {
    auto r = resolve_config_dir({}, fake_env({{"HOME", "/home/ann"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::path("/home/ann/.config/dotkeep"));
}

TEST_CASE("config dir prefers XDG_CONFIG_HOME", "[locator]") {
    auto r = resolve_config_dir({}, fake_env({
        {"HOME", "/home/ann"}, {"XDG_CONFIG_HOME", "/xdg/config"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::path("/xdg/config/dotkeep"));
}

TEST_CASE("relative XDG_CONFIG_HOME is ignored", "[locator]") {
    auto r = resolve_config_dir({}, fake_env({
        {"HOME", "/home/ann"}, {"XDG_CONFIG_HOME", "relative/config"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::path("/home/ann/.config/dotkeep"));
}

TEST_CASE("DOTKEEP_CONFIG_DIR beats XDG", "[locator]") {
    auto r = resolve_config_dir({}, fake_env({
        {"XDG_CONFIG_HOME", "/xdg/config"}, {"DOTKEEP_CONFIG_DIR", "/opt/dots"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::path("/opt/dots"));
}

TEST_CASE("explicit override beats environment", "[locator]") {
    LayoutOverrides overrides;
    overrides.config_dir = fs::path("/flag/dir");
    auto r = resolve_config_dir(overrides, fake_env({{"DOTKEEP_CONFIG_DIR", "/opt/dots"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::path("/flag/dir"));
}

TEST_CASE("no home directory fails with NoHome", "[locator]") {
    auto r = resolve_config_dir({}, fake_env({}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DotkeepError::NoHome);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("empty variables count as unset", "[locator]") {
    auto r = resolve_config_dir({}, fake_env({{"DOTKEEP_CONFIG_DIR", ""}, {"HOME", "/h"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == fs::path("/h/.config/dotkeep"));
}

// ===== resolve_data_dir() / DirLayout =====

TEST_CASE("data dir follows XDG_DATA_HOME then HOME", "[locator]") {
    auto xdg = resolve_data_dir({}, fake_env({{"HOME", "/h"}, {"XDG_DATA_HOME", "/xdg/data"}}));
    REQUIRE(xdg == fs::path("/xdg/data/dotkeep"));

    auto home = resolve_data_dir({}, fake_env({{"HOME", "/h"}}));
    REQUIRE(home == fs::path("/h/.local/share/dotkeep"));

    REQUIRE_FALSE(resolve_data_dir({}, fake_env({})).has_value());
}

TEST_CASE("layout falls back to config root for data", "[locator]") {
    auto r = DirLayout::resolve({}, fake_env({{"DOTKEEP_CONFIG_DIR", "/cfg"}}));
    REQUIRE(r.is_ok());
    const auto& layout = r.value();
    REQUIRE(layout.config_file == fs::path("/cfg/config.toml"));
    REQUIRE(layout.hooks_dir == fs::path("/cfg/hooks"));
    REQUIRE(layout.ignores_dir == fs::path("/cfg/ignores"));
    REQUIRE(layout.repos_dir == fs::path("/cfg/repos"));
}

TEST_CASE("layout propagates NoHome", "[locator]") {
    auto r = DirLayout::resolve({}, fake_env({}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DotkeepError::NoHome);
}

// ===== Locator path joins =====

TEST_CASE("locator path joins", "[locator]") {
    DefaultLocator loc(DirLayout::under("/cfg", "/data"));
    REQUIRE(loc.config_document_path() == fs::path("/cfg/config.toml"));
    REQUIRE(loc.hooks_dir_path() == fs::path("/cfg/hooks"));
    REQUIRE(loc.hook_script_path("vim_plug.sh") == fs::path("/cfg/hooks/vim_plug.sh"));
    REQUIRE(loc.ignore_file_path("vim") == fs::path("/cfg/ignores/vim.ignore"));
    REQUIRE(loc.repo_store_path("vim") == fs::path("/data/repos/vim.git"));
}

TEST_CASE("path joins never touch the filesystem", "[locator]") {
    DefaultLocator loc(DirLayout::under("/__dotkeep_missing__/cfg", "/__dotkeep_missing__/data"));
    REQUIRE(loc.repo_store_path("zsh") == fs::path("/__dotkeep_missing__/data/repos/zsh.git"));
    REQUIRE_FALSE(fs::exists("/__dotkeep_missing__"));
}

// ===== ensure_config_dir_exists() =====

TEST_CASE("ensure_config_dir_exists creates the layout", "[locator]") {
    TempDir td;
    DefaultLocator loc(DirLayout::under(td.path / "cfg", td.path / "data"));

    REQUIRE(loc.ensure_config_dir_exists().is_ok());
    REQUIRE(fs::is_directory(td.path / "cfg" / "hooks"));
    REQUIRE(fs::is_directory(td.path / "cfg" / "ignores"));
    REQUIRE(fs::is_directory(td.path / "data" / "repos"));

    // Idempotent
    REQUIRE(loc.ensure_config_dir_exists().is_ok());
}

TEST_CASE("ensure_config_dir_exists reports IO errors", "[locator]") {
    TempDir td;
    {
        std::ofstream blocker(td.path / "cfg");
        blocker << "not a directory";
    }
    DefaultLocator loc(DirLayout::under(td.path / "cfg", td.path / "data"));

    auto s = loc.ensure_config_dir_exists();
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == DotkeepError::IO);
}

TEST_CASE("locate resolves from the environment", "[locator]") {
    auto r = DefaultLocator::locate({}, fake_env({{"HOME", "/home/ann"}}));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().hooks_dir_path() == fs::path("/home/ann/.config/dotkeep/hooks"));
    REQUIRE(r.value().repos_dir_path() == fs::path("/home/ann/.local/share/dotkeep/repos"));
}
