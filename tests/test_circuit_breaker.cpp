#include <catch2/catch_test_macros.hpp>
#include <tasklist/util/circuit_breaker.h>
#include <thread>

using namespace tasklist;

TEST_CASE("CircuitBreaker: Opens After Threshold", "[pg][breaker]") {
    CircuitBreaker breaker(3, std::chrono::milliseconds(50));

    REQUIRE(breaker.try_acquire());
    breaker.on_failure();
    breaker.on_failure();
    CHECK(breaker.try_acquire());

    breaker.on_failure();
    CHECK_FALSE(breaker.try_acquire());

    SECTION("One trial call is admitted after the cooldown") {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        CHECK(breaker.try_acquire());
        CHECK_FALSE(breaker.try_acquire());

        breaker.on_success();
        CHECK(breaker.try_acquire());
        CHECK(breaker.try_acquire());
    }

    SECTION("A failed trial reopens for a full cooldown") {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        REQUIRE(breaker.try_acquire());
        breaker.on_failure();
        CHECK_FALSE(breaker.try_acquire());

        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        CHECK(breaker.try_acquire());
    }
}

TEST_CASE("CircuitBreaker: Success Resets the Count", "[pg][breaker]") {
    CircuitBreaker breaker(2, std::chrono::seconds(60));

    breaker.on_failure();
    breaker.on_success();
    breaker.on_failure();
    CHECK(breaker.try_acquire());

    breaker.on_failure();
    CHECK_FALSE(breaker.try_acquire());
}
