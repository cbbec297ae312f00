#pragma once

#include "config.hpp"
#include "diagnostics.hpp"
#include "process.hpp"
#include "runfiles.hpp"
#include "workspace.hpp"

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rigor {

    /*
     * Per-test-case harness context: construct one at the start of a test case
     * and let it go out of scope at the end. Owns exactly one workspace (one
     * generation at a time) and builds build-tool invocations that run inside
     * it. Contexts share no state, so parallel test cases each get their own.
     */
    class test_context {
      public:
        explicit test_context(harness_config cfg = config_from_environment());

        const harness_config& config() const { return cfg_; }
        workspace& ws() { return ws_; }
        const workspace& ws() const { return ws_; }

        // Throws resource_not_found when no runfiles are configured.
        const runfiles& resources() const;

        // Invocation of the configured tool: default tool args, then `args`;
        // runs in the workspace root with the configured environment.
        command_invocation tool(std::initializer_list<std::string_view> args) const;
        command_invocation tool(std::span<const std::string> args) const;

        command_result run_tool(std::initializer_list<std::string_view> args) const;
        command_result run(const command_invocation& invocation) const;

        std::filesystem::path scratch_file(std::string_view relative, std::initializer_list<std::string_view> lines);
        std::filesystem::path scratch_file(std::string_view relative, std::span<const std::string> lines);
        std::filesystem::path scratch_executable_file(
                std::string_view relative, std::initializer_list<std::string_view> lines = {});

        std::filesystem::path get_runfile(std::string_view root_name, std::initializer_list<std::string_view> segments) const;
        std::filesystem::path copy_from_runfiles(std::string_view logical_source, std::string_view destination);

        void new_workspace() { ws_.new_workspace(); }
        std::vector<std::string> workspace_contents() const { return ws_.contents(); }

        const std::string& tool_version() const { return cfg_.tool_version; }

        // Rendered in the configured output mode.
        std::string failure_report(const command_result& result) const;

      private:
        harness_config cfg_;
        workspace ws_;
        mutable std::optional<runfiles> resources_{};
    };

}  // namespace rigor
