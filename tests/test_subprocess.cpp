#include <catch2/catch_test_macros.hpp>

#include "platform/subprocess.hpp"

#include <string>

TEST_CASE("platform::run_process", "[subprocess]") {
    using platform::Stream;

    SECTION("CapturesStdout") {
        auto r = platform::run_process({"sh", "-c", "printf hello"}, {.stdout_mode = Stream::Capture});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 0);
        REQUIRE(r->stdout_text == "hello");
    }

    SECTION("SeparatesStreams") {
        auto r = platform::run_process({"sh", "-c", "echo out; echo err >&2"}, {
            .stdout_mode = Stream::Capture,
            .stderr_mode = Stream::Capture,
        });
        REQUIRE(r.has_value());
        REQUIRE(r->stdout_text == "out\n");
        REQUIRE(r->stderr_text == "err\n");
    }

    SECTION("DiscardedStreamIsEmpty") {
        auto r = platform::run_process({"sh", "-c", "echo noise; echo detail >&2"}, {
            .stdout_mode = Stream::Discard,
            .stderr_mode = Stream::Capture,
        });
        REQUIRE(r.has_value());
        REQUIRE(r->stdout_text.empty());
        REQUIRE(r->stderr_text == "detail\n");
    }

    SECTION("LargeOutputDoesNotStall") {
        auto r = platform::run_process({"sh", "-c", "head -c 200000 /dev/zero; head -c 200000 /dev/zero >&2"}, {
            .stdout_mode = Stream::Capture,
            .stderr_mode = Stream::Capture,
        });
        REQUIRE(r.has_value());
        REQUIRE(r->stdout_text.size() == 200000);
        REQUIRE(r->stderr_text.size() == 200000);
    }

    SECTION("FeedsStdin") {
        auto r = platform::run_process({"cat"}, {
            .stdin_data = std::string("transcript text"),
            .stdout_mode = Stream::Capture,
        });
        REQUIRE(r.has_value());
        REQUIRE(r->stdout_text == "transcript text");
    }

    SECTION("ExitCode") {
        auto r = platform::run_process({"sh", "-c", "exit 3"});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 3);
    }

    SECTION("KilledBySignal") {
        auto r = platform::run_process({"sh", "-c", "kill -TERM $$"});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == 128 + 15);
    }

    SECTION("MissingProgram") {
        auto r = platform::run_process({"hs-test-no-such-program"}, {.stderr_mode = Stream::Discard});
        REQUIRE(r.has_value());
        REQUIRE(r->exit_code == platform::exec_failed_code);
    }

    SECTION("EmptyCommandLine") {
        auto r = platform::run_process({});
        REQUIRE_FALSE(r.has_value());
    }
}
