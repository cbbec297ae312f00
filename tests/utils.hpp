#pragma once

#include "rigor.hpp"

#include "../src/internal/json.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rigor::test {
    namespace fs = std::filesystem;
    using namespace rigor::literals;
}  // namespace rigor::test

namespace rigor::test::detail {

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        if (auto parent = path.parent_path(); !parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    // The suffix lookup build-tool tests use against workspace listings.
    inline std::optional<std::string> find_path(const std::vector<std::string>& paths, std::string_view suffix) {
        auto it = std::ranges::find_if(paths, [&](const std::string& p) { return p.ends_with(suffix); });
        if (it == paths.end()) {
            return std::nullopt;
        }
        return *it;
    }

    struct scoped_env_var {
        std::string key{};
        std::optional<std::string> previous{};

        scoped_env_var(std::string key_value, std::optional<std::string> next) : key(std::move(key_value)) {
            if (auto* existing = std::getenv(key.c_str()); existing != nullptr) {
                previous = std::string{existing};
            }

            if (next) {
                REQUIRE(::setenv(key.c_str(), next->c_str(), 1) == 0);
            }
            else {
                REQUIRE(::unsetenv(key.c_str()) == 0);
            }
        }

        ~scoped_env_var() {
            if (previous) {
                (void)::setenv(key.c_str(), previous->c_str(), 1);
            }
            else {
                (void)::unsetenv(key.c_str());
            }
        }
    };

    // Config pointing every workspace at `parent`, isolated from the caller's environment.
    inline harness_config isolated_config(const fs::path& parent) {
        harness_config cfg{};
        cfg.workspace_parent = parent;
        cfg.workspace_prefix = "rigor_test";
        return cfg;
    }

    /*
     * Stand-in for the build tool under test. Understands:
     *   info release             -> "release $FAKE_TOOL_VERSION"
     *   test //:<name>           -> needs BUILD naming <name> and <name>.java in the
     *                               cwd; passes when the source has a testSuccess
     *                               method, else writes "boom" to a test log under
     *                               $FAKE_TOOL_LOGS and points at it with "(see ...)"
     */
    inline constexpr std::string_view fake_tool_script = R"(#!/bin/sh
case "$1" in
  info)
    if [ "$2" = "release" ]; then
      echo "release ${FAKE_TOOL_VERSION}"
      exit 0
    fi
    echo "ERROR: unknown info key '$2'" >&2
    exit 2
    ;;
  test)
    name="${2#//:}"
    if [ ! -f BUILD ]; then
      echo "ERROR: no BUILD file in $(pwd)" >&2
      exit 2
    fi
    if ! grep -q "name = '${name}'" BUILD; then
      echo "ERROR: no such target '$2'" >&2
      exit 1
    fi
    if [ ! -f "${name}.java" ]; then
      echo "ERROR: missing source ${name}.java" >&2
      exit 1
    fi
    logdir="${FAKE_TOOL_LOGS:-$(pwd)/testlogs}/${name}"
    mkdir -p "${logdir}"
    echo "INFO: Analyzed target //:${name}" >&2
    if grep -q "testSuccess" "${name}.java"; then
      echo "PASSED" > "${logdir}/test.log"
      echo "//:${name} PASSED"
      exit 0
    fi
    echo "boom" > "${logdir}/test.log"
    echo "FAIL: //:${name} (see ${logdir}/test.log)" >&2
    exit 3
    ;;
esac
echo "ERROR: unknown command '$1'" >&2
exit 2
)";

    // A fake tool installed in its own workspace, outside any test workspace.
    struct fake_tool {
        workspace home;
        fs::path executable{};
        fs::path logs{};

        explicit fake_tool(const fs::path& parent) : home{parent, "rigor_fake_tool"} {
            executable = home.scratch_file_bytes("bin/fake-build", fake_tool_script);
            fs::permissions(
                    executable,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                            fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
            logs = home.scratch_dir("logs");
        }

        harness_config configure(harness_config cfg, std::string version = "7.4.1") const {
            cfg.tool_path = executable;
            cfg.tool_version = version;
            cfg.environment["FAKE_TOOL_VERSION"] = std::move(version);
            cfg.environment["FAKE_TOOL_LOGS"] = logs.string();
            return cfg;
        }
    };

    inline std::vector<std::string> test_source(std::string_view name, bool passing) {
        if (passing) {
            return {"import org.junit.Test;",
                    std::format("public class {} {{", name),
                    " @Test",
                    " public void testSuccess() {",
                    "  }",
                    "}"};
        }
        return {"import org.junit.Test;",
                std::format("public class {} {{", name),
                " @Test",
                " public void testFailure() {",
                "    throw new AssertionError(\"boom\");",
                "  }",
                "}"};
    }

    inline std::vector<std::string> test_build_file(std::string_view name) {
        return {"load('//:integration_test.bzl', 'java_integration_test')",
                "",
                "java_integration_test(",
                std::format("    name = '{}',", name),
                std::format("    test_class = '{}',", name),
                std::format("    srcs = ['{}.java'],", name),
                ")"};
    }

}  // namespace rigor::test::detail

namespace rigor::test {

    // Matches a zero exit; on mismatch the description carries the full
    // failure report (stderr, workspace listing, referenced logs).
    class successful_exit_matcher : public Catch::Matchers::MatcherBase<command_result> {
      public:
        explicit successful_exit_matcher(const test_context& ctx) : ctx_{ctx} {}

        bool match(const command_result& result) const override {
            if (result.succeeded()) {
                return true;
            }
            report_ = ctx_.failure_report(result);
            return false;
        }

        std::string describe() const override {
            if (report_.empty()) {
                return "exits successfully (0)";
            }
            return "exits successfully (0)\n" + report_;
        }

      private:
        const test_context& ctx_;
        mutable std::string report_{};
    };

    inline successful_exit_matcher successful_exit(const test_context& ctx) {
        return successful_exit_matcher{ctx};
    }

}  // namespace rigor::test
