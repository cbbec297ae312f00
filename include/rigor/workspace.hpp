#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rigor {

    /*
     * Scratch workspace: a disposable sandbox directory tree owned by one test case.
     *
     * The workspace lives under a per-instance base directory
     * <parent>/<prefix>_<pid>_<instance>_<ticks>; each generation is a subdirectory
     * named after its counter. new_workspace() removes the current generation and
     * creates the next one, so the root always exists and is empty right after
     * construction or reset. The whole base directory is removed on destruction
     * unless `keep` was requested.
     *
     * All paths accepted by the scratch operations are relative to the current
     * root; absolute paths and paths that climb out with ".." throw io_failure.
     */
    class workspace {
      public:
        explicit workspace(
                const std::filesystem::path& parent, std::string_view prefix = "rigor_ws", bool keep = false);
        ~workspace();

        workspace(const workspace&) = delete;
        workspace& operator=(const workspace&) = delete;
        workspace(workspace&& other) noexcept;
        workspace& operator=(workspace&& other) noexcept;

        const std::filesystem::path& root() const { return root_; }
        const std::filesystem::path& base() const { return base_; }
        uint64_t generation() const { return generation_; }

        // Lines are joined with '\n' without a trailing separator; no lines
        // yields an empty file. Returns the absolute path written.
        std::filesystem::path scratch_file(std::string_view relative, std::span<const std::string> lines);
        std::filesystem::path scratch_file(std::string_view relative, std::initializer_list<std::string_view> lines);
        std::filesystem::path scratch_file_bytes(std::string_view relative, std::string_view bytes);

        std::filesystem::path scratch_executable_file(
                std::string_view relative, std::span<const std::string> lines);
        std::filesystem::path scratch_executable_file(
                std::string_view relative, std::initializer_list<std::string_view> lines = {});

        std::filesystem::path scratch_dir(std::string_view relative);

        void new_workspace();

        // Every file (and symlink) under the root, recursively, as sorted
        // absolute path strings.
        std::vector<std::string> contents() const;

        // Same entries relative to the root, using '/' separators.
        std::vector<std::string> relative_contents() const;

        std::optional<std::filesystem::path> find(std::string_view relative) const;

        std::string read_file(std::string_view relative) const;

        // Absolute path for `relative` after the escape checks; no filesystem access.
        std::filesystem::path resolve(std::string_view relative) const;

      private:
        void create_generation();
        void remove_base() noexcept;
        std::filesystem::path write_file(std::string_view relative, std::string_view bytes);

        std::filesystem::path base_{};
        std::filesystem::path root_{};
        uint64_t generation_{};
        bool keep_{false};
    };

    // True if the current user may execute `path` (access(2) with X_OK).
    bool is_executable(const std::filesystem::path& path);

}  // namespace rigor
