#include <catch2/catch_test_macros.hpp>

#include <urlcodec/core/result.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace urlcodec;

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
    REQUIRE_FALSE(r.IsOk());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

// ===========================================================================
// ValueOr
// ===========================================================================

TEST_CASE("Result: ValueOr returns value on Ok", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    CHECK(r.ValueOr(0) == 42);
}

TEST_CASE("Result: ValueOr returns default on Err", "[result]") {
    auto r = Result<int, std::string>::Err("fail");
    CHECK(r.ValueOr(99) == 99);
}

// ===========================================================================
// AndThen
// ===========================================================================

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
    auto r2 = r.AndThen([&called](int v) -> Result<std::string, std::string> {
        called = true;
        return Result<std::string, std::string>::Ok(std::to_string(v));
    });
    CHECK_FALSE(called);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error() == "bad");
}

TEST_CASE("Result: AndThen chains multiple", "[result]") {
    auto r = Result<int, std::string>::Ok(5)
        .AndThen([](int v) -> Result<int, std::string> {
            return Result<int, std::string>::Ok(v + 10);
        })
        .AndThen([](int v) -> Result<int, std::string> {
            return Result<int, std::string>::Ok(v * 2);
        });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == 30);
}

TEST_CASE("Result: AndThen chain stops at first Err", "[result]") {
    auto r = Result<int, std::string>::Ok(5)
        .AndThen([](int) -> Result<int, std::string> {
            return Result<int, std::string>::Err("stop here");
        })
        .AndThen([](int v) -> Result<int, std::string> {
            return Result<int, std::string>::Ok(v * 100);
        });
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "stop here");
}

// ===========================================================================
// Map
// ===========================================================================

TEST_CASE("Result: Map transforms value on Ok", "[result]") {
    auto r = Result<int, std::string>::Ok(7);
    auto r2 = r.Map([](int v) { return v * 3; });
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == 21);
}

TEST_CASE("Result: Map passes through Err", "[result]") {
    auto r = Result<int, std::string>::Err("nope");
    bool called = false;
    auto r2 = r.Map([&called](int v) {
        called = true;
        return v * 3;
    });
    CHECK_FALSE(called);
    REQUIRE(r2.IsErr());
    CHECK(r2.Error() == "nope");
}

TEST_CASE("Result: Map changes type", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    auto r2 = r.Map([](int v) -> std::string { return std::to_string(v); });
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == "42");
}

// ===========================================================================
// Copy semantics
// ===========================================================================

TEST_CASE("Result: copy Ok", "[result]") {
    auto r1 = Result<std::string, int>::Ok("hello");
    auto r2 = r1;
    REQUIRE(r1.IsOk());
    REQUIRE(r2.IsOk());
    CHECK(r1.Value() == "hello");
    CHECK(r2.Value() == "hello");
}

TEST_CASE("Result: copy Err", "[result]") {
    auto r1 = Result<std::string, int>::Err(404);
    auto r2 = r1;
    REQUIRE(r1.IsErr());
    REQUIRE(r2.IsErr());
    CHECK(r1.Error() == 404);
    CHECK(r2.Error() == 404);
}

// ===========================================================================
// Move semantics
// ===========================================================================

TEST_CASE("Result: move Ok value out", "[result]") {
    auto r = Result<std::string, int>::Ok("moveable");
    auto val = std::move(r).Value();
    CHECK(val == "moveable");
}

TEST_CASE("Result: move Err value out", "[result]") {
    auto r = Result<int, std::string>::Err("moved error");
    auto err = std::move(r).Error();
    CHECK(err == "moved error");
}

TEST_CASE("Result: move construct", "[result]") {
    auto r1 = Result<std::string, int>::Ok("data");
    auto r2 = std::move(r1);
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == "data");
}

TEST_CASE("Result: move-only type in Ok", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(42));
    REQUIRE(r.IsOk());
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 42);
}

TEST_CASE("Result: ValueOr with move-only rvalue", "[result]") {
    auto r = Result<std::string, int>::Ok("original");
    auto val = std::move(r).ValueOr("default");
    CHECK(val == "original");
}

TEST_CASE("Result: ValueOr rvalue returns default on Err", "[result]") {
    auto r = Result<std::string, int>::Err(1);
    auto val = std::move(r).ValueOr("default");
    CHECK(val == "default");
}

// ===========================================================================
// MapErr
// ===========================================================================

TEST_CASE("Result: MapErr transforms error", "[result]") {
    auto r = Result<int, int>::Err(404);
    auto r2 = std::move(r).MapErr([](int code) { return "code " + std::to_string(code); });
    REQUIRE(r2.IsErr());
    CHECK(r2.Error() == "code 404");
}

TEST_CASE("Result: MapErr passes through Ok", "[result]") {
    auto r = Result<int, int>::Ok(7);
    bool called = false;
    auto r2 = std::move(r).MapErr([&called](int code) {
        called = true;
        return std::to_string(code);
    });
    CHECK_FALSE(called);
    REQUIRE(r2.IsOk());
    CHECK(r2.Value() == 7);
}

// ===========================================================================
// Result<void, E>
// ===========================================================================

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    CHECK(static_cast<bool>(ok));

    auto err = Result<void, std::string>::Err("broken");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "broken");
    CHECK(std::move(err).Error() == "broken");
}

// ===========================================================================
// Error struct
// ===========================================================================

namespace {

Error MakeDecodeFailure() {
    Error e;
    e.operation = "decode";
    e.message = "invalid character 't' (U+0074) at index 6";
    e.category = ErrorCategory::InvalidCharacter;
    e.index = 6;
    e.character = "t";
    e.input = "this%2that";
    e.hint = "only A-Z a-z 0-9 - _ . ~ and %XX triplets may appear";
    return e;
}

} // anonymous namespace

TEST_CASE("Error: ToString with hint", "[error]") {
    auto e = MakeDecodeFailure();
    CHECK(e.ToString() ==
          "decode: invalid character 't' (U+0074) at index 6 "
          "(only A-Z a-z 0-9 - _ . ~ and %XX triplets may appear)");
}

TEST_CASE("Error: ToString without hint", "[error]") {
    Error e;
    e.operation = "ReadInput";
    e.message = "Failed to read input from stdin";
    CHECK(e.ToString() == "ReadInput: Failed to read input from stdin");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e;
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    Error e;
    e.category = ErrorCategory::Config;
    CHECK(e.ExitCode() == 1);
    e.category = ErrorCategory::InvalidCharacter;
    CHECK(e.ExitCode() == 2);
    e.category = ErrorCategory::InvalidUtf8;
    CHECK(e.ExitCode() == 3);
    e.category = ErrorCategory::Io;
    CHECK(e.ExitCode() == 4);
    e.category = ErrorCategory::Internal;
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: CategoryName", "[error]") {
    Error e;
    e.category = ErrorCategory::InvalidCharacter;
    CHECK(e.CategoryName() == "invalid_character");
    e.category = ErrorCategory::InvalidUtf8;
    CHECK(e.CategoryName() == "invalid_utf8");
    e.category = ErrorCategory::Config;
    CHECK(e.CategoryName() == "config");
    e.category = ErrorCategory::Io;
    CHECK(e.CategoryName() == "io");
    e.category = ErrorCategory::Internal;
    CHECK(e.CategoryName() == "internal");
}

TEST_CASE("Error: Config and Io factories", "[error]") {
    auto config = Error::Config("bad key");
    CHECK(config.operation == "ConfigLoader");
    CHECK(config.message == "bad key");
    CHECK(config.category == ErrorCategory::Config);

    auto io = Error::Io("ReadInput", "closed");
    CHECK(io.operation == "ReadInput");
    CHECK(io.category == ErrorCategory::Io);
    CHECK(io.ExitCode() == 4);
}

TEST_CASE("Error: ToJson contains required fields", "[error]") {
    auto json = MakeDecodeFailure().ToJson();
    CHECK(json.find("\"error\":{") != std::string::npos);
    CHECK(json.find("\"category\":\"invalid_character\"") != std::string::npos);
    CHECK(json.find("\"operation\":\"decode\"") != std::string::npos);
    CHECK(json.find("\"index\":6") != std::string::npos);
    CHECK(json.find("\"character\":\"t\"") != std::string::npos);
    CHECK(json.find("\"exit_code\":2") != std::string::npos);
    CHECK(json.find("\"hint\"") != std::string::npos);
}

TEST_CASE("Error: ToJson without optional fields", "[error]") {
    auto json = Error::Io("ReadInput", "closed").ToJson();
    CHECK(json.find("\"category\":\"io\"") != std::string::npos);
    CHECK(json.find("\"index\"") == std::string::npos);
    CHECK(json.find("\"character\"") == std::string::npos);
    CHECK(json.find("\"hint\"") == std::string::npos);
}

TEST_CASE("Error: ToJson never echoes the input", "[error]") {
    auto json = MakeDecodeFailure().ToJson();
    CHECK(json.find("this%2that") == std::string::npos);
}

TEST_CASE("Error: ToJson escapes special characters", "[error]") {
    Error e;
    e.operation = "Op\"Quoted\"";
    e.message = "line1\nline2\t\"quoted\"";
    e.hint = std::string("backslash\\value");
    auto json = e.ToJson();
    CHECK(json.find("\\n") != std::string::npos);
    CHECK(json.find("\\t") != std::string::npos);
    CHECK(json.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(json.find("backslash\\\\value") != std::string::npos);
}

TEST_CASE("Error: ToJson tolerates invalid UTF-8", "[error]") {
    Error e;
    e.operation = "decode";
    e.message = "bad";
    e.character = std::string("\xFF");
    std::string json;
    REQUIRE_NOTHROW(json = e.ToJson());
    CHECK(json.find("\"character\":\"\xEF\xBF\xBD\"") != std::string::npos);
}

TEST_CASE("Error: equality", "[error]") {
    auto e1 = MakeDecodeFailure();
    auto e2 = MakeDecodeFailure();
    auto e3 = MakeDecodeFailure();
    e3.index = 7;
    auto e4 = MakeDecodeFailure();
    e4.hint.reset();
    CHECK(e1 == e2);
    CHECK(e1 != e3);
    CHECK(e1 != e4);
}

TEST_CASE("Result with Error type", "[result][error]") {
    auto r = Result<std::string, Error>::Err(MakeDecodeFailure());
    REQUIRE(r.IsErr());
    CHECK(r.Error().index == std::optional<std::size_t>{6});
    CHECK(r.Error().operation == "decode");
}
