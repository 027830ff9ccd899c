#include <catch2/catch_test_macros.hpp>
#include <tasklist/environment.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>

using namespace tasklist;

TEST_CASE("Environment: .env Loading", "[env]") {
    std::string test_file = "tasklist_test.env";

    unsetenv("TL_KEY1");
    unsetenv("TL_KEY2");
    unsetenv("TL_KEY3");
    unsetenv("TL_KEY4");
    setenv("TL_PRESET", "from-process", 1);

    std::ofstream out(test_file);
    out << "TL_KEY1=VALUE1\n";
    out << "  TL_KEY2 = VALUE2  \n";
    out << "# TL_COMMENT=BLAH\n";
    out << "TL_KEY3=\"QUOTED VALUE\"\n";
    out << "export TL_KEY4='single'\n";
    out << "not a pair\n";
    out << "TL_PRESET=from-file\n";
    out.close();

    SECTION("Loading and Parsing") {
        REQUIRE(load_env(test_file) == true);

        CHECK(std::string(std::getenv("TL_KEY1")) == "VALUE1");
        CHECK(std::string(std::getenv("TL_KEY2")) == "VALUE2");
        CHECK(std::getenv("TL_COMMENT") == nullptr);
        CHECK(std::string(std::getenv("TL_KEY3")) == "QUOTED VALUE");
        CHECK(std::string(std::getenv("TL_KEY4")) == "single");
    }

    SECTION("Existing variables win over the file") {
        REQUIRE(load_env(test_file) == true);
        CHECK(std::string(std::getenv("TL_PRESET")) == "from-process");
    }

    SECTION("Non-existent file") {
        CHECK(load_env("missing.env") == false);
    }

    std::remove(test_file.c_str());
    unsetenv("TL_PRESET");
}

TEST_CASE("Environment: Typed Lookup", "[env]") {
    setenv("TL_INT", "8080", 1);
    setenv("TL_BAD_INT", "80x", 1);
    setenv("TL_BOOL", "yes", 1);
    setenv("TL_EMPTY", "", 1);
    unsetenv("TL_ABSENT");

    CHECK(env<int>("TL_INT") == 8080);
    CHECK(env<bool>("TL_BOOL") == true);
    CHECK(env<std::string>("TL_ABSENT", std::string("fallback")) == "fallback");
    CHECK(env<int>("TL_EMPTY", 7) == 7);

    CHECK_THROWS_AS(env<std::string>("TL_ABSENT"), ConfigError);
    CHECK_THROWS_AS(env<int>("TL_BAD_INT"), ConfigError);

    try {
        env<int>("TL_BAD_INT");
    } catch (const ConfigError& e) {
        CHECK(std::string(e.what()).rfind("TL_BAD_INT: ", 0) == 0);
    }
}
