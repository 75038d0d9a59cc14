#include <catch2/catch_test_macros.hpp>

#include "scriptbox/core/error.hpp"

using namespace scriptbox;

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        Error err(ErrorCode::IoError, "script not found");
        CHECK(err.code() == ErrorCode::IoError);
        CHECK(err.message() == "script not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "script not found");
    }

    SECTION("error with detail") {
        Error err(ErrorCode::IoError, "Cannot create scratch file", "No such file or directory");
        CHECK(err.code() == ErrorCode::IoError);
        CHECK(err.detail() == "No such file or directory");
        CHECK(err.what() == "Cannot create scratch file: No such file or directory");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = make_error(ErrorCode::InvalidConfig, "bad port");
        CHECK(err.code() == ErrorCode::InvalidConfig);
        CHECK(err.message() == "bad port");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = make_error(ErrorCode::IoError, "Cannot open config file", "/etc/x.json");
        CHECK(err.code() == ErrorCode::IoError);
        CHECK(err.what() == "Cannot open config file: /etc/x.json");
    }
}

TEST_CASE("Result carries a value or an error", "[error]") {
    Result<int> ok = 42;
    REQUIRE(ok.has_value());
    CHECK(*ok == 42);

    Result<int> bad = std::unexpected(make_error(ErrorCode::InvalidConfig, "bad value"));
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code() == ErrorCode::InvalidConfig);
}

TEST_CASE("VoidResult success and failure", "[error]") {
    VoidResult ok;
    CHECK(ok.has_value());

    VoidResult bad = std::unexpected(make_error(ErrorCode::IoError, "bind failed"));
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().message() == "bind failed");
}

TEST_CASE("error_code_to_string names every code", "[error]") {
    CHECK(error_code_to_string(ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(error_code_to_string(ErrorCode::IoError) == "IO_ERROR");
}
