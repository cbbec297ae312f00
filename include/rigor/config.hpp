#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigor {

    using namespace std::string_view_literals;

    /*
     * Rigor Harness Config Options
     *
     * Tool under test
     * - tool_path: Build-tool executable (path, or bare name searched on PATH).
     * - tool_args: Arguments inserted before every per-call argument list
     *   (startup flags such as an rc-file override).
     * - tool_version: Version string the tool is expected to report.
     * - timeout_ms: Per-invocation wall-time cap; 0 disables it.
     *
     * Runfiles
     * - runfiles_dir: Root of a runfiles tree (<dir>/<root>/<segments...>).
     * - runfiles_manifest: Manifest mapping logical paths to real paths; takes
     *   precedence over runfiles_dir when both are set.
     *
     * Workspace
     * - workspace_parent: Directory under which workspaces are created.
     * - workspace_prefix: Name prefix for the per-context workspace base.
     * - keep_workspace: Leave the tree on disk at teardown for inspection.
     *
     * Environment
     * - inherit_environment: Start the child from the parent's environment.
     * - environment: Variables set (or overridden) for every tool invocation.
     *
     * Reporting
     * - output: Failure-report rendering ("text" or "json").
     *
     * Environment variable overlays (applied after the config file):
     *   RIGOR_TOOL, RIGOR_TOOL_VERSION, RIGOR_TIMEOUT_MS, RIGOR_KEEP_WORKSPACE,
     *   RIGOR_OUTPUT, RUNFILES_DIR, TEST_SRCDIR, RUNFILES_MANIFEST_FILE, TEST_TMPDIR.
     * RIGOR_CONFIG names the JSON config file read by config_from_environment().
     */

    enum class output_mode { text, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::text:
                return "text"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "text"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "text"sv) || utils::str_case_eq(text, "table"sv)) {
            out = output_mode::text;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    struct harness_config {
        std::filesystem::path tool_path{"bazel"};
        std::vector<std::string> tool_args{};
        std::string tool_version{};
        uint32_t timeout_ms{0U};

        std::optional<std::filesystem::path> runfiles_dir{};
        std::optional<std::filesystem::path> runfiles_manifest{};

        std::optional<std::filesystem::path> workspace_parent{};
        std::string workspace_prefix{"rigor_ws"};
        bool keep_workspace{false};

        bool inherit_environment{true};
        std::map<std::string, std::string> environment{};

        output_mode output{output_mode::text};
    };

    // Reads a JSON config file over `base`; keys absent from the file keep
    // their value in `base`. Throws config_error.
    harness_config load_config_file(const std::filesystem::path& path, harness_config base = {});

    // Overlays the environment variables listed above. Throws config_error on
    // malformed values.
    void apply_environment(harness_config& cfg);

    // Defaults, then $RIGOR_CONFIG (if set), then environment overlays.
    harness_config config_from_environment();

    // Directory workspaces are created under when workspace_parent is unset.
    std::filesystem::path default_workspace_parent();

}  // namespace rigor
