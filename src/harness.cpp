#include "rigor/harness.hpp"

#include "rigor/utils.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace rigor {

    namespace detail {

        static fs::path workspace_parent_for(const harness_config& cfg) {
            return cfg.workspace_parent ? *cfg.workspace_parent : default_workspace_parent();
        }

    }  // namespace detail

    test_context::test_context(harness_config cfg)
            : cfg_{std::move(cfg)}, ws_{detail::workspace_parent_for(cfg_), cfg_.workspace_prefix, cfg_.keep_workspace} {}

    const runfiles& test_context::resources() const {
        if (!resources_) {
            resources_.emplace(runfiles::create(cfg_));
        }
        return *resources_;
    }

    command_invocation test_context::tool(std::span<const std::string> args) const {
        command_invocation invocation{};
        invocation.args.reserve(1U + cfg_.tool_args.size() + args.size());
        invocation.args.push_back(cfg_.tool_path.string());
        invocation.args.insert(invocation.args.end(), cfg_.tool_args.begin(), cfg_.tool_args.end());
        invocation.args.insert(invocation.args.end(), args.begin(), args.end());
        invocation.working_dir = ws_.root();
        invocation.environment = cfg_.environment;
        invocation.inherit_environment = cfg_.inherit_environment;
        if (cfg_.timeout_ms != 0U) {
            invocation.timeout = std::chrono::milliseconds{cfg_.timeout_ms};
        }
        return invocation;
    }

    command_invocation test_context::tool(std::initializer_list<std::string_view> args) const {
        std::vector<std::string> owned(args.begin(), args.end());
        return tool(std::span<const std::string>{owned});
    }

    command_result test_context::run_tool(std::initializer_list<std::string_view> args) const {
        return run(tool(args));
    }

    command_result test_context::run(const command_invocation& invocation) const {
        return rigor::run(invocation);
    }

    fs::path test_context::scratch_file(std::string_view relative, std::initializer_list<std::string_view> lines) {
        return ws_.scratch_file(relative, lines);
    }

    fs::path test_context::scratch_file(std::string_view relative, std::span<const std::string> lines) {
        return ws_.scratch_file(relative, lines);
    }

    fs::path test_context::scratch_executable_file(
            std::string_view relative, std::initializer_list<std::string_view> lines) {
        return ws_.scratch_executable_file(relative, lines);
    }

    fs::path test_context::get_runfile(std::string_view root_name, std::initializer_list<std::string_view> segments) const {
        return resources().resolve(root_name, segments);
    }

    fs::path test_context::copy_from_runfiles(std::string_view logical_source, std::string_view destination) {
        return resources().copy_into(ws_, logical_source, destination);
    }

    std::string test_context::failure_report(const command_result& result) const {
        return render_report(build_failure_report(result, ws_), cfg_.output);
    }

}  // namespace rigor
