#include <catch2/catch.hpp>
#include <dotkeep/result.hpp>
#include <memory>
#include <string>

using namespace dotkeep;

static Result<int> parse_port(const std::string& text) {
    if (text.empty()) {
        return DotkeepError{DotkeepError::InvalidArg, "empty port"};
    }
    return Result<int>::ok(std::stoi(text));
}

static Status check_port(const std::string& text) {
    DOTKEEP_TRY(parse_port(text));
    return ok_status();
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(DotkeepError{DotkeepError::NotFound, "missing repo"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == DotkeepError::NotFound);
    REQUIRE(r.error().message == "missing repo");
}

TEST_CASE("Errors convert implicitly into any Result", "[result]") {
    Result<std::string> r = DotkeepError{DotkeepError::IO, "disk full"};
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DotkeepError::IO);
}

TEST_CASE("Accessing the wrong alternative throws", "[result]") {
    auto err = Result<int>::err(DotkeepError{DotkeepError::IO, "fail"});
    REQUIRE_THROWS_AS(err.value(), std::bad_variant_access);

    auto ok = Result<int>::ok(1);
    REQUIRE_THROWS_AS(ok.error(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on error", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(DotkeepError{DotkeepError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("DOTKEEP_TRY propagates errors across result types", "[result]") {
    auto s = check_port("");
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == DotkeepError::InvalidArg);
    REQUIRE(s.error().message == "empty port");

    REQUIRE(check_port("22").is_ok());
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);

    auto moved = std::move(r).value();
    REQUIRE(*moved == 99);
}

TEST_CASE("format() renders hint and location", "[error]") {
    DotkeepError e{DotkeepError::Parse, "expected '='", "check the key", "config.toml", 3, 7};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Parse]: expected '='") != std::string::npos);
    REQUIRE(formatted.find("hint: check the key") != std::string::npos);
    REQUIRE(formatted.find("--> config.toml:3:7") != std::string::npos);
}

TEST_CASE("format() omits empty hint and location", "[error]") {
    DotkeepError e{DotkeepError::NoHome, "cannot determine path to home directory"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[NoHome]: cannot determine path to home directory");
}

TEST_CASE("code_name() covers every code", "[error]") {
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::NoHome)) == "NoHome");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::IO)) == "IO");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::Parse)) == "Parse");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::DuplicateRepo)) == "DuplicateRepo");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::NotFound)) == "NotFound");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::ScriptNotFound)) == "ScriptNotFound");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::Execution)) == "Execution");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::UserDeclined)) == "UserDeclined");
    REQUIRE(std::string(DotkeepError::code_name(DotkeepError::InvalidArg)) == "InvalidArg");
}
