#include "rigor/runfiles.hpp"

#include "rigor/errors.hpp"
#include "rigor/format.hpp"
#include "rigor/utils.hpp"
#include "rigor/workspace.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace rigor::literals;

namespace rigor {

    namespace detail {

        // Rejects empty and "." / ".." segments; returns the joined logical path.
        static std::string normalize_logical(std::string_view logical_path) {
            std::string joined{};
            size_t start = 0U;
            while (start <= logical_path.size()) {
                auto end = logical_path.find('/', start);
                if (end == std::string_view::npos) {
                    end = logical_path.size();
                }
                auto segment = logical_path.substr(start, end - start);
                if (segment.empty() || segment == "."sv || segment == ".."sv) {
                    throw resource_not_found("invalid runfile path: '{}'"_format(logical_path));
                }
                if (!joined.empty()) {
                    joined.push_back('/');
                }
                joined.append(segment);
                start = end + 1U;
            }
            return joined;
        }

    }  // namespace detail

    runfiles runfiles::from_directory(const fs::path& dir) {
        std::error_code ec{};
        if (!fs::is_directory(dir, ec)) {
            throw resource_not_found("runfiles directory does not exist: {}"_format(dir.string()));
        }
        runfiles rf{};
        rf.dir_ = fs::absolute(dir, ec);
        if (ec) {
            throw resource_not_found("runfiles directory is not accessible: {}"_format(dir.string()));
        }
        return rf;
    }

    runfiles runfiles::from_manifest(const fs::path& manifest) {
        std::ifstream in{manifest};
        if (!in) {
            throw resource_not_found("runfiles manifest does not exist: {}"_format(manifest.string()));
        }

        runfiles rf{};
        rf.manifest_based_ = true;
        std::string line{};
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            auto sep = line.find(' ');
            if (sep == std::string::npos || sep == 0U || sep + 1U == line.size()) {
                // entries without a real path stand for empty files; nothing to resolve
                continue;
            }
            rf.manifest_.insert_or_assign(line.substr(0U, sep), fs::path{line.substr(sep + 1U)});
        }
        if (in.bad()) {
            throw resource_not_found("failed to read runfiles manifest: {}"_format(manifest.string()));
        }
        debug_log("loaded ", rf.manifest_.size(), " runfiles manifest entries from ", manifest.string());
        return rf;
    }

    runfiles runfiles::create(const harness_config& cfg) {
        if (cfg.runfiles_manifest) {
            return from_manifest(*cfg.runfiles_manifest);
        }
        if (cfg.runfiles_dir) {
            return from_directory(*cfg.runfiles_dir);
        }
        throw resource_not_found("no runfiles configured (set RUNFILES_DIR, TEST_SRCDIR or RUNFILES_MANIFEST_FILE)");
    }

    std::optional<fs::path> runfiles::lookup(const std::string& logical) const {
        fs::path candidate{};
        if (manifest_based_) {
            auto it = manifest_.find(logical);
            if (it == manifest_.end()) {
                return std::nullopt;
            }
            candidate = it->second;
        }
        else {
            candidate = dir_ / logical;
        }

        std::error_code ec{};
        if (!fs::exists(candidate, ec)) {
            return std::nullopt;
        }
        return candidate;
    }

    fs::path runfiles::resolve(std::string_view root_name, std::initializer_list<std::string_view> segments) const {
        std::string logical{root_name};
        for (auto segment : segments) {
            logical.push_back('/');
            logical.append(segment);
        }
        return resolve(logical);
    }

    fs::path runfiles::resolve(std::string_view logical_path) const {
        auto logical = detail::normalize_logical(logical_path);
        if (auto found = lookup(logical)) {
            return *found;
        }
        throw resource_not_found("runfile not found: {}"_format(logical));
    }

    fs::path runfiles::copy_into(workspace& ws, std::string_view logical_source, std::string_view destination) const {
        auto source = resolve(logical_source);
        auto target = ws.resolve(destination);
        if (target == ws.root()) {
            throw io_failure("not a file path: {}"_format(destination));
        }

        auto parent = fs::path{destination}.lexically_normal().parent_path();
        if (!parent.empty()) {
            ws.scratch_dir(parent.generic_string());
        }

        std::error_code ec{};
        if (fs::is_directory(source, ec)) {
            fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        }
        else {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        }
        if (ec) {
            throw io_failure(
                    "failed to copy {} to {}: {}"_format(source.string(), target.string(), ec.message()));
        }
        debug_log("copied runfile ", logical_source, " -> ", target.string());
        return target;
    }

}  // namespace rigor
