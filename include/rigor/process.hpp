#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rigor {

    struct command_invocation {
        // args[0] is the executable: a path, or a bare name searched on PATH.
        std::vector<std::string> args{};
        // Unset means the calling process's current directory.
        std::optional<std::filesystem::path> working_dir{};
        // Set or override on top of the inherited environment (or on their own
        // when inherit_environment is false).
        std::map<std::string, std::string> environment{};
        bool inherit_environment{true};
        std::optional<std::chrono::milliseconds> timeout{};
    };

    struct command_result {
        int exit_code{};
        std::vector<std::string> stdout_lines{};
        std::vector<std::string> stderr_lines{};
        bool timed_out{false};

        bool succeeded() const { return exit_code == 0 && !timed_out; }
    };

    /*
     * Runs `invocation` to completion. stdout and stderr are drained together
     * while the child runs, so neither stream can fill its pipe and stall the
     * child. Exit status is WEXITSTATUS, or 128 + signal number when the child
     * was killed by a signal.
     *
     * Throws launch_failure when the executable cannot be started at all
     * (not found, not executable, bad working directory, exec error).
     */
    command_result run(const command_invocation& invocation);

    // PATH lookup as execvp does it; nullopt when nothing executable matches.
    std::optional<std::filesystem::path> find_executable(
            const std::string& name, const std::optional<std::string>& search_path);

}  // namespace rigor
