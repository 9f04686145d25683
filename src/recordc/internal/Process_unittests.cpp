#include "recordc/internal/Process.hpp"

#include "doctest/doctest.h"

#include <chrono>
#include <string>

namespace recordc {

TEST_CASE("runProcess") {
    SUBCASE("captures stdout, stderr and exit status") {
        auto result = runProcess({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, std::chrono::milliseconds(0));
        CHECK(result.spawned);
        CHECK_FALSE(result.timedOut);
        CHECK_EQ(result.exitStatus, 3);
        CHECK(result.output.find("out\n") != std::string::npos);
        CHECK(result.output.find("err\n") != std::string::npos);
    }

    SUBCASE("arguments are passed without a shell") {
        auto result = runProcess({"/bin/sh", "-c", "printf '%s' \"$1\"", "sh", "{\"a\": \"b c|$HOME\"}"},
                std::chrono::milliseconds(0));
        CHECK_EQ(result.exitStatus, 0);
        CHECK_EQ(result.output, "{\"a\": \"b c|$HOME\"}");
    }

    SUBCASE("stdin is empty") {
        auto result = runProcess({"/bin/cat"}, std::chrono::milliseconds(5000));
        CHECK_FALSE(result.timedOut);
        CHECK_EQ(result.exitStatus, 0);
        CHECK(result.output.empty());
    }

    SUBCASE("timeout kills the child") {
        auto start = std::chrono::steady_clock::now();
        auto result = runProcess({"/bin/sh", "-c", "exec sleep 10"}, std::chrono::milliseconds(100));
        CHECK(result.spawned);
        CHECK(result.timedOut);
        CHECK_NE(result.exitStatus, 0);
        CHECK_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    }

    SUBCASE("missing program") {
        auto result = runProcess({"/nonexistent/recordc-program"}, std::chrono::milliseconds(0));
        // Depending on the C library the failure is reported by the spawn or by the child exiting with 127.
        if (result.spawned) {
            CHECK_EQ(result.exitStatus, 127);
        } else {
            CHECK_FALSE(result.spawnError.empty());
        }
    }

    SUBCASE("no arguments") {
        auto result = runProcess({}, std::chrono::milliseconds(0));
        CHECK_FALSE(result.spawned);
    }
}

TEST_CASE("ChildProcess") {
    SUBCASE("echo through cat") {
        ChildProcess child;
        std::string error;
        REQUIRE(child.spawn({"/bin/cat"}, error));
        CHECK(child.isRunning());
        CHECK(child.write("hello\n"));

        std::string buffer;
        bool timedOut = false;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (buffer.size() < 6 && child.read(buffer, deadline, timedOut)) {}
        CHECK_FALSE(timedOut);
        CHECK_EQ(buffer, "hello\n");

        child.terminate(std::chrono::milliseconds(1000));
        CHECK_FALSE(child.isRunning());
    }

    SUBCASE("read times out") {
        ChildProcess child;
        std::string error;
        REQUIRE(child.spawn({"/bin/cat"}, error));
        std::string buffer;
        bool timedOut = false;
        CHECK_FALSE(child.read(buffer, std::chrono::steady_clock::now() + std::chrono::milliseconds(50), timedOut));
        CHECK(timedOut);
        CHECK(child.isRunning());
    }

    SUBCASE("end of stream") {
        ChildProcess child;
        std::string error;
        REQUIRE(child.spawn({"/bin/sh", "-c", "printf done"}, error));
        std::string buffer;
        bool timedOut = false;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (child.read(buffer, deadline, timedOut)) {}
        CHECK_FALSE(timedOut);
        CHECK_EQ(buffer, "done");
    }

    SUBCASE("terminate kills a child that ignores stdin") {
        ChildProcess child;
        std::string error;
        REQUIRE(child.spawn({"/bin/sh", "-c", "exec sleep 10"}, error));
        auto start = std::chrono::steady_clock::now();
        child.terminate(std::chrono::milliseconds(50));
        CHECK_FALSE(child.isRunning());
        CHECK_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    }

    SUBCASE("spawn twice") {
        ChildProcess child;
        std::string error;
        REQUIRE(child.spawn({"/bin/cat"}, error));
        CHECK_FALSE(child.spawn({"/bin/cat"}, error));
        CHECK_FALSE(error.empty());
    }
}

} // namespace recordc
