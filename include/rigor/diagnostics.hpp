#pragma once

#include "config.hpp"
#include "process.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rigor {

    class workspace;

    // Literal marker introducing a secondary log path in stderr: "(see <path>)".
    inline constexpr std::string_view log_reference_marker = "(see "sv;

    struct log_reference {
        std::string path{};
        // index into the stderr lines the reference was found on
        size_t line_index{};
    };

    struct log_section {
        std::string path{};
        bool available{false};
        std::vector<std::string> lines{};
        // why the log could not be read; empty when available
        std::string error{};
    };

    struct diagnostic_report {
        int exit_code{};
        bool timed_out{false};
        std::vector<std::string> stderr_lines{};
        std::vector<std::string> workspace_listing{};
        // set when the workspace could not be listed
        std::optional<std::string> listing_error{};
        std::vector<log_section> logs{};
    };

    // Every "(see <path>)" in `stderr_lines`, in the order the markers appear.
    // Markers with no closing ')' or an empty path are skipped.
    std::vector<log_reference> extract_log_references(const std::vector<std::string>& stderr_lines);

    // Never throws for unreadable logs or listing errors; those are recorded
    // in the report instead so the failure being explained stays visible.
    diagnostic_report build_failure_report(const command_result& result, const workspace& ws);

    std::string render_report(const diagnostic_report& report, output_mode mode = output_mode::text);

}  // namespace rigor
