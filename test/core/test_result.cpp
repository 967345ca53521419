#include <catch2/catch_test_macros.hpp>

#include <toolhost/core/result.hpp>

#include <cerrno>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace toolhost;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value can be taken out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    auto p = std::move(r).Value();
    REQUIRE(p != nullptr);
    CHECK(*p == 7);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// ValueOr / AndThen / Map
// ===========================================================================

TEST_CASE("Result: ValueOr", "[result]") {
    CHECK(Result<int, std::string>::Ok(42).ValueOr(0) == 42);
    CHECK(Result<int, std::string>::Err("fail").ValueOr(99) == 99);
}

TEST_CASE("Result: AndThen chains on Ok", "[result]") {
    auto r = Result<int, std::string>::Ok(10);
    auto r2 = r.AndThen([](int v) -> Result<std::string, std::string> {
        return Result<std::string, std::string>::Ok(std::to_string(v * 2));
    });
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == "20");
}

TEST_CASE("Result: AndThen short-circuits on Err", "[result]") {
    auto r = Result<int, std::string>::Err("bad");
    bool called = false;
    auto r2 = r.AndThen([&called](int v) -> Result<int, std::string> {
        called = true;
        return Result<int, std::string>::Ok(v);
    });
    CHECK_FALSE(called);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error() == "bad");
}

TEST_CASE("Result: Map transforms Ok and passes Err through", "[result]") {
    auto doubled = Result<int, std::string>::Ok(21).Map([](int v) { return v * 2; });
    REQUIRE(doubled.IsOk());
    CHECK(doubled.Value() == 42);

    auto err = Result<int, std::string>::Err("x").Map([](int v) { return v * 2; });
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "x");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: FromErrno carries the OS message", "[result][error]") {
    auto e = Error::FromErrno("ReadFile", "/nope", ENOENT);
    CHECK(e.operation == "ReadFile");
    CHECK(e.target == "/nope");
    CHECK(e.category == ErrorCategory::Io);
    CHECK_FALSE(e.http_status.has_value());
    CHECK(e.message == "No such file or directory");
}

TEST_CASE("Error: ToString formats all parts", "[result][error]") {
    Error e{"HttpClient", "http://example.test/", 502, "bad gateway",
            ErrorCategory::Http};
    CHECK(e.ToString() == "HttpClient [http://example.test/] (HTTP 502): bad gateway");

    Error bare{"ConfigLoader", "", std::nullopt, "missing", ErrorCategory::Config};
    CHECK(bare.ToString() == "ConfigLoader: missing");

    std::ostringstream oss;
    oss << bare;
    CHECK(oss.str() == bare.ToString());
}

TEST_CASE("Error: CategoryName and equality", "[result][error]") {
    Error a{"op", "t", std::nullopt, "m", ErrorCategory::Timeout};
    Error b = a;
    CHECK(a.CategoryName() == "timeout");
    CHECK(a == b);
    b.message = "other";
    CHECK(a != b);
}
