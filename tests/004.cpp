#include "utils.hpp"

#include <atomic>
#include <csignal>
#include <thread>

namespace rigor::test {

    namespace detail {
        inline command_invocation shell(std::string script) {
            command_invocation invocation{};
            invocation.args = {"/bin/sh", "-c", std::move(script)};
            return invocation;
        }
    }  // namespace detail

    TEST_CASE("004: stdout and stderr are captured as ordered lines", "[004][process]") {
        auto result = run(detail::shell("echo one; echo alpha >&2; echo two; printf 'beta\\r\\ngamma' >&2; exit 0"));

        CHECK(result.exit_code == 0);
        CHECK(result.succeeded());
        CHECK(result.stdout_lines == std::vector<std::string>{"one", "two"});
        CHECK(result.stderr_lines == std::vector<std::string>{"alpha", "beta", "gamma"});
        CHECK_FALSE(result.timed_out);
    }

    TEST_CASE("004: nonzero exit codes are results, not errors", "[004][process]") {
        auto result = run(detail::shell("echo failing >&2; exit 42"));
        CHECK(result.exit_code == 42);
        CHECK_FALSE(result.succeeded());
        CHECK(result.stderr_lines == std::vector<std::string>{"failing"});

        auto signaled = run(detail::shell("kill -TERM $$"));
        CHECK(signaled.exit_code == 128 + SIGTERM);
    }

    TEST_CASE("004: large output on both streams is fully drained", "[004][process]") {
        // each stream carries well over a pipe buffer's worth, written interleaved
        auto result = run(detail::shell(
                "i=0; while [ $i -lt 20000 ]; do echo \"out-$i\"; echo \"err-$i\" >&2; i=$((i+1)); done"));

        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_lines.size() == 20000U);
        REQUIRE(result.stderr_lines.size() == 20000U);
        CHECK(result.stdout_lines.front() == "out-0");
        CHECK(result.stdout_lines.back() == "out-19999");
        CHECK(result.stderr_lines[12345] == "err-12345");
        CHECK(result.stderr_lines.back() == "err-19999");
    }

    TEST_CASE("004: working directory and environment reach the child", "[004][process]") {
        detail::temp_dir tmp{"rigor_004_env"};
        workspace ws{tmp.path};
        ws.scratch_file("marker.txt", {"present"});

        auto invocation = detail::shell("cat marker.txt; echo \"$RIGOR_PROBE\"; pwd");
        invocation.working_dir = ws.root();
        invocation.environment["RIGOR_PROBE"] = "probe-value";

        auto result = run(invocation);
        REQUIRE(result.exit_code == 0);
        REQUIRE(result.stdout_lines.size() == 3U);
        CHECK(result.stdout_lines[0] == "present");
        CHECK(result.stdout_lines[1] == "probe-value");
        CHECK(fs::equivalent(result.stdout_lines[2], ws.root()));
    }

    TEST_CASE("004: environment can start empty", "[004][process]") {
        detail::scoped_env_var leaked{"RIGOR_SHOULD_NOT_LEAK", "leaked"};

        auto invocation = detail::shell("echo \"[${RIGOR_SHOULD_NOT_LEAK}]\"; echo \"[${ONLY_THIS}]\"");
        invocation.inherit_environment = false;
        invocation.environment["ONLY_THIS"] = "set";

        auto result = run(invocation);
        REQUIRE(result.exit_code == 0);
        CHECK(result.stdout_lines == std::vector<std::string>{"[]", "[set]"});
    }

    TEST_CASE("004: bare executable names are searched on PATH", "[004][process]") {
        command_invocation invocation{};
        invocation.args = {"sh", "-c", "echo found"};
        auto result = run(invocation);
        CHECK(result.stdout_lines == std::vector<std::string>{"found"});

        CHECK(find_executable("sh", std::string{"/nonexistent:/bin:/usr/bin"}));
        CHECK_FALSE(find_executable("rigor-no-such-tool", std::string{"/bin:/usr/bin"}));
    }

    TEST_CASE("004: launch failures are distinct from nonzero exits", "[004][process]") {
        detail::temp_dir tmp{"rigor_004_launch"};
        workspace ws{tmp.path};

        SECTION("missing executable") {
            command_invocation invocation{};
            invocation.args = {(tmp.path / "does-not-exist").string()};
            CHECK_THROWS_AS(run(invocation), launch_failure);
        }

        SECTION("not on PATH") {
            command_invocation invocation{};
            invocation.args = {"rigor-no-such-tool-on-path"};
            CHECK_THROWS_AS(run(invocation), launch_failure);
        }

        SECTION("not executable") {
            auto plain = ws.scratch_file("not-executable.sh", {"#!/bin/sh", "exit 0"});
            command_invocation invocation{};
            invocation.args = {plain.string()};
            CHECK_THROWS_AS(run(invocation), launch_failure);
        }

        SECTION("exec format error") {
            auto garbage = ws.scratch_executable_file("garbage", {"\x7f" "ELF-not-really"});
            command_invocation invocation{};
            invocation.args = {garbage.string()};
            try {
                static_cast<void>(run(invocation));
                FAIL("expected launch_failure");
            } catch (const launch_failure& e) {
                CHECK(e.kind() == error_kind::launch_failure);
            }
        }

        SECTION("missing working directory") {
            auto invocation = detail::shell("exit 0");
            invocation.working_dir = tmp.path / "no-such-dir";
            CHECK_THROWS_AS(run(invocation), launch_failure);
        }

        SECTION("empty argument vector") {
            CHECK_THROWS_AS(run(command_invocation{}), launch_failure);
        }
    }

    TEST_CASE("004: timeout kills the child", "[004][process]") {
        auto invocation = detail::shell("echo started; exec sleep 30");
        invocation.timeout = std::chrono::milliseconds{300};

        auto start = std::chrono::steady_clock::now();
        auto result = run(invocation);
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(result.timed_out);
        CHECK_FALSE(result.succeeded());
        CHECK(result.exit_code == 128 + SIGKILL);
        CHECK(result.stdout_lines == std::vector<std::string>{"started"});
        CHECK(elapsed < std::chrono::seconds{10});
    }

    TEST_CASE("004: timeouts beyond the poll range are not truncated", "[004][process]") {
        // 2^32 + 200ms would wrap to a 200ms wait if narrowed to int
        auto invocation = detail::shell("sleep 1; echo done");
        invocation.timeout = std::chrono::milliseconds{(1LL << 32) + 200};

        auto result = run(invocation);
        CHECK_FALSE(result.timed_out);
        CHECK(result.exit_code == 0);
        CHECK(result.stdout_lines == std::vector<std::string>{"done"});
    }

    TEST_CASE("004: a long-running child on another thread does not hold our pipes", "[004][process]") {
        std::atomic<bool> sleeper_done{false};
        std::thread sleeper{[&sleeper_done] {
            auto result = run(detail::shell("exec sleep 2"));
            static_cast<void>(result);
            sleeper_done = true;
        }};

        command_invocation quick{};
        quick.args = {"/bin/true"};
        auto slowest = std::chrono::steady_clock::duration::zero();
        for (int i = 0; i < 50 && !sleeper_done; ++i) {
            auto start = std::chrono::steady_clock::now();
            auto result = run(quick);
            slowest = std::max(slowest, std::chrono::steady_clock::now() - start);
            CHECK(result.exit_code == 0);
        }
        sleeper.join();

        CHECK(slowest < std::chrono::milliseconds{1500});
    }

}  // namespace rigor::test
