#include "rigor/process.hpp"

#include "rigor/errors.hpp"
#include "rigor/format.hpp"
#include "rigor/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

extern char** environ;

namespace fs = std::filesystem;
using namespace rigor::literals;

namespace rigor {

    namespace detail {

        struct scoped_fd {
            int fd{-1};

            scoped_fd() = default;
            explicit scoped_fd(int value) : fd{value} {}
            scoped_fd(const scoped_fd&) = delete;
            scoped_fd& operator=(const scoped_fd&) = delete;
            scoped_fd(scoped_fd&& other) noexcept : fd{std::exchange(other.fd, -1)} {}
            scoped_fd& operator=(scoped_fd&& other) noexcept {
                if (this != &other) {
                    reset();
                    fd = std::exchange(other.fd, -1);
                }
                return *this;
            }
            ~scoped_fd() { reset(); }

            void reset() {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }
        };

        struct pipe_pair {
            scoped_fd read_end{};
            scoped_fd write_end{};
        };

        static std::string errno_message(int err) {
            return std::error_code{err, std::generic_category()}.message();
        }

        // Both ends are created close-on-exec in one step, so a fork on another
        // thread never inherits them; dup2 onto 0/1/2 in the child clears the flag
        // for the copies the child actually keeps.
        static pipe_pair make_pipe(std::string_view purpose) {
            int fds[2]{};
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                throw launch_failure("pipe2() failed for {}: {}"_format(purpose, errno_message(errno)));
            }
            return pipe_pair{scoped_fd{fds[0]}, scoped_fd{fds[1]}};
        }

        static std::map<std::string, std::string> build_environment(const command_invocation& invocation) {
            std::map<std::string, std::string> env{};
            if (invocation.inherit_environment && environ != nullptr) {
                for (char** entry = environ; *entry != nullptr; ++entry) {
                    std::string_view kv{*entry};
                    auto eq = kv.find('=');
                    if (eq == std::string_view::npos || eq == 0U) {
                        continue;
                    }
                    env.emplace(std::string{kv.substr(0U, eq)}, std::string{kv.substr(eq + 1U)});
                }
            }
            for (const auto& [key, value] : invocation.environment) {
                env.insert_or_assign(key, value);
            }
            return env;
        }

        static fs::path resolve_executable(
                const command_invocation& invocation, const std::map<std::string, std::string>& env) {
            const auto& name = invocation.args.front();
            if (name.empty()) {
                throw launch_failure("empty executable name");
            }

            if (name.find('/') != std::string::npos) {
                std::error_code ec{};
                auto path = fs::absolute(name, ec);
                if (ec) {
                    throw launch_failure("cannot resolve executable {}: {}"_format(name, ec.message()));
                }
                if (!fs::exists(path, ec)) {
                    throw launch_failure("executable not found: {}"_format(path.string()));
                }
                if (fs::is_directory(path, ec) || ::access(path.c_str(), X_OK) != 0) {
                    throw launch_failure("not executable: {}"_format(path.string()));
                }
                return path;
            }

            std::optional<std::string> search_path{};
            if (auto it = env.find("PATH"); it != env.end()) {
                search_path = it->second;
            }
            else if (auto* parent_path = std::getenv("PATH"); parent_path != nullptr) {
                search_path = std::string{parent_path};
            }
            if (auto found = find_executable(name, search_path)) {
                return *found;
            }
            throw launch_failure("executable not found on PATH: {}"_format(name));
        }

        static int decode_wait_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static int wait_for_child(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    throw launch_failure("waitpid failed: {}"_format(errno_message(errno)));
                }
            }
            return status;
        }

        // Child-side failure report: which step failed and its errno.
        struct launch_report {
            int stage{};
            int error{};
        };

        inline constexpr int stage_stdio = 1;
        inline constexpr int stage_chdir = 2;
        inline constexpr int stage_exec = 3;

        [[noreturn]] static void child_fail(int status_fd, int stage) {
            launch_report report{.stage = stage, .error = errno};
            auto n = ::write(status_fd, &report, sizeof(report));
            static_cast<void>(n);
            _exit(127);
        }

    }  // namespace detail

    std::optional<fs::path> find_executable(const std::string& name, const std::optional<std::string>& search_path) {
        std::string_view dirs{search_path ? std::string_view{*search_path} : "/usr/bin:/bin"sv};
        size_t start = 0U;
        while (start <= dirs.size()) {
            auto end = dirs.find(':', start);
            if (end == std::string_view::npos) {
                end = dirs.size();
            }
            auto dir = dirs.substr(start, end - start);
            // an empty PATH entry means the current directory
            auto candidate = (dir.empty() ? fs::path{"."} : fs::path{dir}) / name;
            std::error_code ec{};
            if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
                return fs::absolute(candidate, ec);
            }
            start = end + 1U;
        }
        return std::nullopt;
    }

    command_result run(const command_invocation& invocation) {
        if (invocation.args.empty()) {
            throw launch_failure("empty argument vector");
        }

        auto env = detail::build_environment(invocation);
        auto executable = detail::resolve_executable(invocation, env);

        if (invocation.working_dir) {
            std::error_code ec{};
            if (!fs::is_directory(*invocation.working_dir, ec)) {
                throw launch_failure("working directory does not exist: {}"_format(invocation.working_dir->string()));
            }
        }

        // Everything the child needs is built before fork.
        std::vector<char*> argv{};
        argv.reserve(invocation.args.size() + 1U);
        for (const auto& arg : invocation.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        std::vector<std::string> env_entries{};
        env_entries.reserve(env.size());
        for (const auto& [key, value] : env) {
            env_entries.push_back("{}={}"_format(key, value));
        }
        std::vector<char*> envp{};
        envp.reserve(env_entries.size() + 1U);
        for (auto& entry : env_entries) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        std::string working_dir{invocation.working_dir ? invocation.working_dir->string() : std::string{}};
        std::string exe_path{executable.string()};

        detail::scoped_fd dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
        if (dev_null.fd < 0) {
            throw launch_failure("failed to open /dev/null: {}"_format(detail::errno_message(errno)));
        }
        auto out_pipe = detail::make_pipe("stdout");
        auto err_pipe = detail::make_pipe("stderr");
        auto status_pipe = detail::make_pipe("launch status");

        debug_log("launching ", exe_path, " (", invocation.args.size(), " args) in ",
                  working_dir.empty() ? std::string{"<cwd>"} : working_dir);

        auto pid = ::fork();
        if (pid < 0) {
            throw launch_failure("fork failed: {}"_format(detail::errno_message(errno)));
        }

        if (pid == 0) {
            auto status_fd = status_pipe.write_end.fd;
            if (::dup2(dev_null.fd, STDIN_FILENO) < 0 || ::dup2(out_pipe.write_end.fd, STDOUT_FILENO) < 0 ||
                ::dup2(err_pipe.write_end.fd, STDERR_FILENO) < 0) {
                detail::child_fail(status_fd, detail::stage_stdio);
            }
            if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
                detail::child_fail(status_fd, detail::stage_chdir);
            }
            ::execve(exe_path.c_str(), argv.data(), envp.data());
            detail::child_fail(status_fd, detail::stage_exec);
        }

        // parent
        dev_null.reset();
        out_pipe.write_end.reset();
        err_pipe.write_end.reset();
        status_pipe.write_end.reset();

        // EOF here means exec succeeded and closed the close-on-exec write end.
        detail::launch_report report{};
        ssize_t got = 0;
        do {
            got = ::read(status_pipe.read_end.fd, &report, sizeof(report));
        } while (got < 0 && errno == EINTR);
        status_pipe.read_end.reset();

        if (got == static_cast<ssize_t>(sizeof(report))) {
            static_cast<void>(detail::wait_for_child(pid));
            switch (report.stage) {
                case detail::stage_chdir:
                    throw launch_failure(
                            "cannot enter working directory {}: {}"_format(
                                    working_dir, detail::errno_message(report.error)));
                case detail::stage_exec:
                    throw launch_failure(
                            "exec of {} failed: {}"_format(exe_path, detail::errno_message(report.error)));
                default:
                    throw launch_failure(
                            "failed to set up stdio for {}: {}"_format(
                                    exe_path, detail::errno_message(report.error)));
            }
        }

        std::string out_buf{};
        std::string err_buf{};
        bool timed_out = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = out_pipe.read_end.fd, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = err_pipe.read_end.fd, .events = POLLIN, .revents = 0};

        std::optional<std::chrono::steady_clock::time_point> deadline{};
        if (invocation.timeout) {
            deadline = std::chrono::steady_clock::now() + *invocation.timeout;
        }

        while (fds_open > 0) {
            int wait_ms = -1;
            if (deadline) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         *deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(std::min<long long>(remaining, std::numeric_limits<int>::max()));
            }

            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                ::kill(pid, SIGKILL);
                static_cast<void>(detail::wait_for_child(pid));
                throw launch_failure("poll failed while draining {}: {}"_format(exe_path, detail::errno_message(errno)));
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? out_buf : err_buf).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                        continue;
                    }
                    else {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (timed_out) {
            debug_log("timeout reached, killing pid ", static_cast<long>(pid));
            ::kill(pid, SIGKILL);
        }

        out_pipe.read_end.reset();
        err_pipe.read_end.reset();

        auto status = detail::wait_for_child(pid);

        command_result result{};
        result.exit_code = detail::decode_wait_status(status);
        result.stdout_lines = utils::split_lines(out_buf);
        result.stderr_lines = utils::split_lines(err_buf);
        result.timed_out = timed_out;

        debug_log("process ", exe_path, " exited with ", result.exit_code, " (", result.stdout_lines.size(),
                  " stdout lines, ", result.stderr_lines.size(), " stderr lines)");
        return result;
    }

}  // namespace rigor
