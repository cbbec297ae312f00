#pragma once

#include "rigor/diagnostics.hpp"

#include <glaze/glaze.hpp>

namespace glz {

    template <>
    struct meta<rigor::log_section> {
        using T = rigor::log_section;
        static constexpr auto value =
                object("path", &T::path, "available", &T::available, "lines", &T::lines, "error", &T::error);
    };

    template <>
    struct meta<rigor::diagnostic_report> {
        using T = rigor::diagnostic_report;
        static constexpr auto value = object(
                "exit_code",
                &T::exit_code,
                "timed_out",
                &T::timed_out,
                "stderr",
                &T::stderr_lines,
                "workspace",
                &T::workspace_listing,
                "workspace_error",
                &T::listing_error,
                "logs",
                &T::logs);
    };

}  // namespace glz
