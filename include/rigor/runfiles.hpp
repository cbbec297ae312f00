#pragma once

#include "config.hpp"

#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rigor {

    class workspace;

    /*
     * Resolves logical resource ids ("<root>/<segments...>") prepared before the
     * test run to real filesystem paths. Two lookup strategies, matching the
     * common runfiles layouts:
     *
     *   directory: <dir>/<root>/<segments...>
     *   manifest:  a text file of "<logical path> <real path>" lines
     *
     * Every failed lookup throws resource_not_found; nothing is retried.
     */
    class runfiles {
      public:
        static runfiles from_directory(const std::filesystem::path& dir);
        static runfiles from_manifest(const std::filesystem::path& manifest);

        // Manifest if configured, else directory; resource_not_found if neither is set.
        static runfiles create(const harness_config& cfg);

        std::filesystem::path resolve(std::string_view root_name, std::initializer_list<std::string_view> segments) const;

        // `logical_path` is "<root>/<segments...>" with '/' separators.
        std::filesystem::path resolve(std::string_view logical_path) const;

        // Copies the resource's bytes to `destination` (relative to the
        // workspace root), creating parent directories as needed.
        std::filesystem::path copy_into(
                workspace& ws, std::string_view logical_source, std::string_view destination) const;

        bool is_manifest_based() const { return manifest_based_; }

      private:
        runfiles() = default;

        std::optional<std::filesystem::path> lookup(const std::string& logical) const;

        std::filesystem::path dir_{};
        std::map<std::string, std::filesystem::path, std::less<>> manifest_{};
        bool manifest_based_{false};
    };

}  // namespace rigor
