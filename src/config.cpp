#include "rigor/config.hpp"

#include "rigor/errors.hpp"
#include "rigor/format.hpp"

#include <glaze/glaze.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace rigor::literals;

namespace rigor::detail {

    // On-disk shape of the config file. Every key is optional so that a file
    // only overrides what it names.
    struct config_file_record {
        int schema_version{1};
        std::optional<std::string> tool_path{};
        std::optional<std::vector<std::string>> tool_args{};
        std::optional<std::string> tool_version{};
        std::optional<uint32_t> timeout_ms{};
        std::optional<std::string> runfiles_dir{};
        std::optional<std::string> runfiles_manifest{};
        std::optional<std::string> workspace_parent{};
        std::optional<std::string> workspace_prefix{};
        std::optional<bool> keep_workspace{};
        std::optional<bool> inherit_environment{};
        std::optional<std::map<std::string, std::string>> environment{};
        std::optional<std::string> output{};
    };

}  // namespace rigor::detail

namespace glz {

    template <>
    struct meta<rigor::detail::config_file_record> {
        using T = rigor::detail::config_file_record;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "tool_path",
                       &T::tool_path,
                       "tool_args",
                       &T::tool_args,
                       "tool_version",
                       &T::tool_version,
                       "timeout_ms",
                       &T::timeout_ms,
                       "runfiles_dir",
                       &T::runfiles_dir,
                       "runfiles_manifest",
                       &T::runfiles_manifest,
                       "workspace_parent",
                       &T::workspace_parent,
                       "workspace_prefix",
                       &T::workspace_prefix,
                       "keep_workspace",
                       &T::keep_workspace,
                       "inherit_environment",
                       &T::inherit_environment,
                       "environment",
                       &T::environment,
                       "output",
                       &T::output);
    };

}  // namespace glz

namespace rigor {

    namespace detail {

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw config_error("failed to open config file {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw config_error("failed to read config file {}"_format(path.string()));
            }
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw config_error(
                        "unsupported schema_version in {}: {} > {}"_format(
                                path.string(), schema_version, supported_schema_version));
            }
        }

        // Relative paths in a config file are relative to the file itself.
        static fs::path anchor_path(const fs::path& config_path, std::string_view value) {
            fs::path p{value};
            if (p.is_absolute()) {
                return p;
            }
            return (config_path.parent_path() / p).lexically_normal();
        }

        static std::optional<std::string> env_value(const char* key) {
            if (auto* value = std::getenv(key); value != nullptr && *value != '\0') {
                return std::string{value};
            }
            return std::nullopt;
        }

    }  // namespace detail

    harness_config load_config_file(const fs::path& path, harness_config base) {
        auto json = detail::read_text_file(path);

        detail::config_file_record record{};
        if (auto ec = glz::read_json(record, json)) {
            throw config_error("failed to parse config file {}: {}"_format(path.string(), glz::format_error(ec, json)));
        }
        detail::validate_supported_schema_version(record.schema_version, path);

        if (record.tool_path) {
            auto tool = fs::path{*record.tool_path};
            // bare names stay bare so that they are looked up on PATH
            base.tool_path = tool.has_parent_path() ? detail::anchor_path(path, *record.tool_path) : tool;
        }
        if (record.tool_args) {
            base.tool_args = std::move(*record.tool_args);
        }
        if (record.tool_version) {
            base.tool_version = std::move(*record.tool_version);
        }
        if (record.timeout_ms) {
            base.timeout_ms = *record.timeout_ms;
        }
        if (record.runfiles_dir) {
            base.runfiles_dir = detail::anchor_path(path, *record.runfiles_dir);
        }
        if (record.runfiles_manifest) {
            base.runfiles_manifest = detail::anchor_path(path, *record.runfiles_manifest);
        }
        if (record.workspace_parent) {
            base.workspace_parent = detail::anchor_path(path, *record.workspace_parent);
        }
        if (record.workspace_prefix) {
            if (record.workspace_prefix->empty() || record.workspace_prefix->find('/') != std::string::npos) {
                throw config_error("invalid workspace_prefix in {}: '{}'"_format(path.string(), *record.workspace_prefix));
            }
            base.workspace_prefix = std::move(*record.workspace_prefix);
        }
        if (record.keep_workspace) {
            base.keep_workspace = *record.keep_workspace;
        }
        if (record.inherit_environment) {
            base.inherit_environment = *record.inherit_environment;
        }
        if (record.environment) {
            for (auto& [key, value] : *record.environment) {
                base.environment.insert_or_assign(key, std::move(value));
            }
        }
        if (record.output && !try_parse_output_mode(*record.output, base.output)) {
            throw config_error("invalid output in {}: {} (expected text|json)"_format(path.string(), *record.output));
        }

        return base;
    }

    void apply_environment(harness_config& cfg) {
        if (auto tool = detail::env_value("RIGOR_TOOL")) {
            cfg.tool_path = *tool;
        }
        if (auto version = detail::env_value("RIGOR_TOOL_VERSION")) {
            cfg.tool_version = *version;
        }
        if (auto timeout = detail::env_value("RIGOR_TIMEOUT_MS")) {
            auto parsed = utils::parse_arithmetic<uint32_t>(utils::trim_view(*timeout));
            if (!parsed) {
                throw config_error("invalid RIGOR_TIMEOUT_MS: {}"_format(*timeout));
            }
            cfg.timeout_ms = *parsed;
        }
        if (auto keep = detail::env_value("RIGOR_KEEP_WORKSPACE")) {
            auto parsed = utils::parse_bool(*keep);
            if (!parsed) {
                throw config_error("invalid RIGOR_KEEP_WORKSPACE: {}"_format(*keep));
            }
            cfg.keep_workspace = *parsed;
        }
        if (auto output = detail::env_value("RIGOR_OUTPUT")) {
            if (!try_parse_output_mode(*output, cfg.output)) {
                throw config_error("invalid RIGOR_OUTPUT: {} (expected text|json)"_format(*output));
            }
        }

        if (auto manifest = detail::env_value("RUNFILES_MANIFEST_FILE")) {
            cfg.runfiles_manifest = fs::path{*manifest};
        }
        if (auto dir = detail::env_value("RUNFILES_DIR")) {
            cfg.runfiles_dir = fs::path{*dir};
        }
        else if (auto srcdir = detail::env_value("TEST_SRCDIR")) {
            cfg.runfiles_dir = fs::path{*srcdir};
        }

        if (auto tmpdir = detail::env_value("TEST_TMPDIR")) {
            cfg.workspace_parent = fs::path{*tmpdir};
        }
    }

    harness_config config_from_environment() {
        harness_config cfg{};
        if (auto path = detail::env_value("RIGOR_CONFIG")) {
            debug_log("loading config file ", *path);
            cfg = load_config_file(*path, std::move(cfg));
        }
        apply_environment(cfg);
        return cfg;
    }

    fs::path default_workspace_parent() {
        if (auto tmpdir = detail::env_value("TEST_TMPDIR")) {
            return fs::path{*tmpdir};
        }
        std::error_code ec{};
        auto tmp = fs::temp_directory_path(ec);
        if (ec) {
            return fs::path{"/tmp"};
        }
        return tmp;
    }

}  // namespace rigor
