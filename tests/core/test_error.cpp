// impulse_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <impulse/core/error.hpp>
#include <string>
#include <vector>

using namespace impulse_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ShapeError::invalid_dimension") {
        Error err = ShapeError::invalid_dimension("sphere", "radius");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is<ShapeError>());
        REQUIRE(err.as<ShapeError>()->shape == "sphere");
        REQUIRE(err.message().find("radius") != std::string::npos);
    }

    SECTION("ShapeError::not_convex") {
        Error err = ShapeError::not_convex("convex_polygon");
        REQUIRE(err.code() == ErrorCode::ValidationError);
    }

    SECTION("ShapeError::degenerate_normal") {
        Error err = ShapeError::degenerate_normal("plane");
        REQUIRE(err.code() == ErrorCode::NumericalError);
    }

    SECTION("BodyError::non_finite_pose") {
        Error err = BodyError::non_finite_pose(7);
        REQUIRE(err.code() == ErrorCode::NumericalError);
        REQUIRE(err.as<BodyError>()->entity == 7);
        REQUIRE(err.message().find("7") != std::string::npos);
    }

    SECTION("BodyError::duplicate_id") {
        Error err = BodyError::duplicate_id(3);
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
    }

    SECTION("BodyError::missing_shape") {
        Error err = BodyError::missing_shape(3);
        REQUIRE(err.code() == ErrorCode::NotFound);
    }

    SECTION("ConfigError::invalid_value") {
        Error err = ConfigError::invalid_value("slop", "must be >= 0");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.as<ConfigError>()->key == "slop");
    }

    SECTION("ConfigError::file_not_found") {
        Error err = ConfigError::file_not_found("physics.json");
        REQUIRE(err.code() == ErrorCode::IOError);
        REQUIRE_FALSE(err.is<BodyError>());
        REQUIRE(err.as<BodyError>() == nullptr);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = ConfigError::invalid_value("cell_size", "must be > 0");
    err.with_context("file", "physics.json");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[ValidationError]") != std::string::npos);
    REQUIRE(chain.find("ConfigError:InvalidValue") != std::string::npos);
    REQUIRE(chain.find("key: cell_size") != std::string::npos);
    REQUIRE(chain.find("file: physics.json") != std::string::npos);
}

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();

    debug::record_error(BodyError::non_finite_pose(1));
    debug::record_error(BodyError::non_finite_velocity(2));
    debug::record_error(ConfigError::parse_error("bad"));

    REQUIRE(debug::total_error_count() == 3);
    REQUIRE(debug::error_count(ErrorCode::NumericalError) == 2);
    REQUIRE(debug::error_count(ErrorCode::ParseError) == 1);
    REQUIRE(debug::error_count(ErrorCode::NotFound) == 0);

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err void with kind") {
        Result<void> r = Err(ShapeError::non_finite("box"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NumericalError);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);

        Result<void> v = Err(Error("error"));
        REQUIRE_THROWS_AS(v.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "gone"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::NotFound);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == "42");
    }

    SECTION("and_then on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
    }
}

TEST_CASE("Result with containers", "[core][result]") {
    Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
    REQUIRE(r.is_ok());
    REQUIRE(r->size() == 3);
}
