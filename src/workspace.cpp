#include "rigor/workspace.hpp"

#include "rigor/errors.hpp"
#include "rigor/format.hpp"
#include "rigor/utils.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace rigor::literals;

namespace rigor {

    namespace detail {

        static std::atomic<uint64_t> workspace_instance_counter{0U};

        static std::string join_lines(std::span<const std::string> lines) {
            std::string joined{};
            for (size_t i = 0U; i < lines.size(); ++i) {
                if (i != 0U) {
                    joined.push_back('\n');
                }
                joined.append(lines[i]);
            }
            return joined;
        }

        static std::string join_lines(std::initializer_list<std::string_view> lines) {
            std::string joined{};
            bool first = true;
            for (auto line : lines) {
                if (!first) {
                    joined.push_back('\n');
                }
                joined.append(line);
                first = false;
            }
            return joined;
        }

        static void ensure_dir(const fs::path& path) {
            std::error_code ec{};
            fs::create_directories(path, ec);
            if (ec) {
                throw io_failure("failed to create directory {}: {}"_format(path.string(), ec.message()));
            }
            if (!fs::is_directory(path, ec)) {
                throw io_failure("not a directory: {}"_format(path.string()));
            }
        }

        static void add_exec_permissions(const fs::path& path) {
            std::error_code ec{};
            fs::permissions(
                    path,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add,
                    ec);
            if (ec) {
                throw io_failure("failed to mark {} executable: {}"_format(path.string(), ec.message()));
            }
        }

    }  // namespace detail

    workspace::workspace(const fs::path& parent, std::string_view prefix, bool keep) : keep_{keep} {
        if (prefix.empty() || prefix.find('/') != std::string_view::npos) {
            throw io_failure("invalid workspace prefix: '{}'"_format(prefix));
        }
        detail::ensure_dir(parent);

        std::error_code abs_ec{};
        auto abs_parent = fs::absolute(parent, abs_ec);
        if (abs_ec) {
            throw io_failure("failed to resolve workspace parent {}: {}"_format(parent.string(), abs_ec.message()));
        }

        // A pre-existing directory with the same name is never reused.
        for (;;) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            auto instance = detail::workspace_instance_counter.fetch_add(1U);
            std::ostringstream dir_name{};
            dir_name << prefix << '_' << static_cast<long>(::getpid()) << '_' << instance << '_' << now;

            auto candidate = abs_parent / dir_name.str();
            std::error_code ec{};
            if (fs::create_directory(candidate, ec)) {
                base_ = candidate.lexically_normal();
                break;
            }
            if (ec) {
                throw io_failure("failed to create workspace {}: {}"_format(candidate.string(), ec.message()));
            }
        }

        create_generation();
    }

    workspace::~workspace() {
        remove_base();
    }

    workspace::workspace(workspace&& other) noexcept
            : base_{std::exchange(other.base_, {})},
              root_{std::exchange(other.root_, {})},
              generation_{other.generation_},
              keep_{other.keep_} {}

    workspace& workspace::operator=(workspace&& other) noexcept {
        if (this != &other) {
            remove_base();
            base_ = std::exchange(other.base_, {});
            root_ = std::exchange(other.root_, {});
            generation_ = other.generation_;
            keep_ = other.keep_;
        }
        return *this;
    }

    void workspace::create_generation() {
        root_ = base_ / std::to_string(generation_);
        detail::ensure_dir(root_);
        debug_log("workspace generation ", generation_, " at ", root_.string());
    }

    void workspace::remove_base() noexcept {
        if (base_.empty()) {
            return;
        }
        if (keep_) {
            debug_log("keeping workspace ", base_.string());
            return;
        }
        std::error_code ec{};
        fs::remove_all(base_, ec);
        if (ec) {
            debug_log("failed to remove workspace ", base_.string(), ": ", ec.message());
        }
        base_.clear();
        root_.clear();
    }

    void workspace::new_workspace() {
        std::error_code ec{};
        fs::remove_all(root_, ec);
        if (ec) {
            throw io_failure("failed to discard workspace {}: {}"_format(root_.string(), ec.message()));
        }
        ++generation_;
        create_generation();
    }

    fs::path workspace::resolve(std::string_view relative) const {
        if (relative.empty()) {
            throw io_failure("empty workspace path");
        }
        fs::path rel{relative};
        if (rel.is_absolute()) {
            throw io_failure("workspace path must be relative: {}"_format(relative));
        }
        auto normal = rel.lexically_normal();
        if (!normal.empty() && *normal.begin() == "..") {
            throw io_failure("workspace path escapes the workspace root: {}"_format(relative));
        }
        if (normal == ".") {
            return root_;
        }
        return root_ / normal;
    }

    fs::path workspace::write_file(std::string_view relative, std::string_view bytes) {
        auto target = resolve(relative);
        if (target == root_ || !target.has_filename()) {
            throw io_failure("not a file path: {}"_format(relative));
        }

        detail::ensure_dir(target.parent_path());

        std::error_code ec{};
        if (fs::is_directory(target, ec)) {
            throw io_failure("cannot overwrite directory with file: {}"_format(target.string()));
        }

        std::ofstream out{target, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw io_failure("failed to open file for write: {}"_format(target.string()));
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            throw io_failure("failed to write file: {}"_format(target.string()));
        }
        return target;
    }

    fs::path workspace::scratch_file(std::string_view relative, std::span<const std::string> lines) {
        return write_file(relative, detail::join_lines(lines));
    }

    fs::path workspace::scratch_file(std::string_view relative, std::initializer_list<std::string_view> lines) {
        return write_file(relative, detail::join_lines(lines));
    }

    fs::path workspace::scratch_file_bytes(std::string_view relative, std::string_view bytes) {
        return write_file(relative, bytes);
    }

    fs::path workspace::scratch_executable_file(std::string_view relative, std::span<const std::string> lines) {
        auto target = write_file(relative, detail::join_lines(lines));
        detail::add_exec_permissions(target);
        return target;
    }

    fs::path workspace::scratch_executable_file(
            std::string_view relative, std::initializer_list<std::string_view> lines) {
        auto target = write_file(relative, detail::join_lines(lines));
        detail::add_exec_permissions(target);
        return target;
    }

    fs::path workspace::scratch_dir(std::string_view relative) {
        auto target = resolve(relative);
        detail::ensure_dir(target);
        return target;
    }

    std::vector<std::string> workspace::contents() const {
        std::vector<std::string> paths{};
        std::error_code ec{};
        fs::recursive_directory_iterator it{root_, ec};
        if (ec) {
            throw io_failure("failed to list workspace {}: {}"_format(root_.string(), ec.message()));
        }
        for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
            if (ec) {
                throw io_failure("failed to list workspace {}: {}"_format(root_.string(), ec.message()));
            }
            std::error_code status_ec{};
            if (!it->is_directory(status_ec) || it->is_symlink(status_ec)) {
                paths.push_back(it->path().string());
            }
        }
        if (ec) {
            throw io_failure("failed to list workspace {}: {}"_format(root_.string(), ec.message()));
        }
        std::ranges::sort(paths);
        return paths;
    }

    std::vector<std::string> workspace::relative_contents() const {
        auto absolute = contents();
        std::vector<std::string> relative{};
        relative.reserve(absolute.size());
        for (const auto& path : absolute) {
            relative.push_back(fs::path{path}.lexically_relative(root_).generic_string());
        }
        return relative;
    }

    std::optional<fs::path> workspace::find(std::string_view relative) const {
        auto target = resolve(relative);
        std::error_code ec{};
        auto status = fs::symlink_status(target, ec);
        if (ec || !fs::exists(status) || fs::is_directory(status)) {
            return std::nullopt;
        }
        return target;
    }

    std::string workspace::read_file(std::string_view relative) const {
        auto target = resolve(relative);
        std::ifstream in{target, std::ios::binary};
        if (!in) {
            throw io_failure("failed to open file for read: {}"_format(target.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw io_failure("failed to read file: {}"_format(target.string()));
        }
        return ss.str();
    }

    bool is_executable(const fs::path& path) {
        return ::access(path.c_str(), X_OK) == 0;
    }

}  // namespace rigor
