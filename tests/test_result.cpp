#include <catch2/catch.hpp>
#include <globstar/result.hpp>
#include <memory>
#include <string>

using namespace globstar;

static Result<int> try_double(Result<int> input) {
    GLOBSTAR_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status check_positive(int v) {
    if (v <= 0) return GlobError{GlobError::InvalidArg, "not positive"};
    return ok_status();
}

static Result<std::string> describe(int v) {
    GLOBSTAR_TRY(check_positive(v));
    return Result<std::string>::ok("value " + std::to_string(v));
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(GlobError{GlobError::NotFound, "missing dir"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GlobError::NotFound);
    REQUIRE(r.error().message == "missing dir");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(GlobError{GlobError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto ok = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(ok.value() == 10);

    bool called = false;
    auto err = Result<int>::err(GlobError{GlobError::Parse, "bad"})
        .map([&](int x) { called = true; return x; });
    REQUIRE(err.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(err.error().code == GlobError::Parse);
}

TEST_CASE("map() changes the value type", "[result]") {
    auto r = Result<int>::ok(3).map([](int x) { return std::string(static_cast<size_t>(x), '*'); });
    REQUIRE(r.value() == "***");

    auto status = check_positive(-2).map([](std::monostate) { return 1; });
    REQUIRE(status.is_err());
    REQUIRE(status.error().code == GlobError::InvalidArg);
}

TEST_CASE("GLOBSTAR_TRY propagates errors", "[result]") {
    auto out = try_double(Result<int>::err(GlobError{GlobError::Parse, "syntax"}));
    REQUIRE(out.is_err());
    REQUIRE(out.error().message == "syntax");
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("GLOBSTAR_TRY across Result types", "[result]") {
    REQUIRE(describe(3).value() == "value 3");
    auto r = describe(-1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GlobError::InvalidArg);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    auto moved = std::move(r).value();
    REQUIRE(*moved == 99);
}

TEST_CASE("GlobError format() output", "[error]") {
    GlobError e{GlobError::Config, "bad separator", "use '/'", "globstar.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]") != std::string::npos);
    REQUIRE(formatted.find("bad separator") != std::string::npos);
    REQUIRE(formatted.find("hint: use '/'") != std::string::npos);
    REQUIRE(formatted.find("--> globstar.toml:3") != std::string::npos);
}

TEST_CASE("GlobError format() without hint or file", "[error]") {
    GlobError e{GlobError::IO, "cannot list"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[IO]: cannot list");
}

TEST_CASE("GlobError code_name() for all codes", "[error]") {
    REQUIRE(std::string(GlobError::code_name(GlobError::IO)) == "IO");
    REQUIRE(std::string(GlobError::code_name(GlobError::Config)) == "Config");
    REQUIRE(std::string(GlobError::code_name(GlobError::Parse)) == "Parse");
    REQUIRE(std::string(GlobError::code_name(GlobError::NotFound)) == "NotFound");
    REQUIRE(std::string(GlobError::code_name(GlobError::InvalidArg)) == "InvalidArg");
}
