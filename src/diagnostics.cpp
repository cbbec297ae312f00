#include "rigor/diagnostics.hpp"

#include "rigor/errors.hpp"
#include "rigor/format.hpp"
#include "rigor/utils.hpp"
#include "rigor/workspace.hpp"

#include "internal/json.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace rigor::literals;

namespace rigor {

    namespace detail {

        static log_section read_log(const fs::path& path) {
            log_section section{.path = path.string()};

            std::error_code ec{};
            auto status = fs::status(path, ec);
            if (ec || !fs::exists(status)) {
                section.error = "log file does not exist";
                return section;
            }
            if (fs::is_directory(status)) {
                section.error = "log path is a directory";
                return section;
            }
            if (!fs::is_regular_file(status)) {
                section.error = "log path is not a regular file";
                return section;
            }

            std::ifstream in{path};
            if (!in) {
                section.error = "cannot open log file: {}"_format(
                        std::error_code{errno, std::generic_category()}.message());
                return section;
            }
            std::string line{};
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                section.lines.push_back(line);
            }
            if (in.bad()) {
                section.lines.clear();
                section.error = "error while reading log file";
                return section;
            }
            section.available = true;
            return section;
        }

        static void render_text(const diagnostic_report& report, std::ostringstream& os) {
            os << "exit code was " << report.exit_code;
            if (report.timed_out) {
                os << " (timed out)";
            }
            os << '\n';

            os << "std-error:\n";
            for (const auto& line : report.stderr_lines) {
                os << line << '\n';
            }

            os << "Workspace contents:\n";
            if (report.listing_error) {
                os << "<unavailable: " << *report.listing_error << ">\n";
            }
            for (const auto& path : report.workspace_listing) {
                os << path << '\n';
            }

            if (report.logs.empty()) {
                return;
            }
            os << "Contents of internal test logs:\n";
            os << "*******************************\n";
            for (const auto& log : report.logs) {
                os << "Log path:\n" << log.path << '\n';
                if (!log.available) {
                    os << "Log unavailable: " << log.error << '\n';
                    continue;
                }
                os << "Log contents:\n";
                for (size_t i = 0U; i < log.lines.size(); ++i) {
                    os << log.path << ':' << (i + 1U) << ": " << log.lines[i] << '\n';
                }
            }
        }

    }  // namespace detail

    std::vector<log_reference> extract_log_references(const std::vector<std::string>& stderr_lines) {
        std::vector<log_reference> refs{};
        for (size_t index = 0U; index < stderr_lines.size(); ++index) {
            std::string_view line{stderr_lines[index]};
            size_t pos = 0U;
            while ((pos = line.find(log_reference_marker, pos)) != std::string_view::npos) {
                auto start = pos + log_reference_marker.size();
                auto close = line.find(')', start);
                if (close == std::string_view::npos) {
                    break;
                }
                auto path = utils::trim_view(line.substr(start, close - start));
                if (!path.empty()) {
                    refs.push_back(log_reference{.path = std::string{path}, .line_index = index});
                }
                pos = close + 1U;
            }
        }
        return refs;
    }

    diagnostic_report build_failure_report(const command_result& result, const workspace& ws) {
        diagnostic_report report{};
        report.exit_code = result.exit_code;
        report.timed_out = result.timed_out;
        report.stderr_lines = result.stderr_lines;

        try {
            report.workspace_listing = ws.contents();
        } catch (const harness_error& e) {
            report.listing_error = e.what();
        }

        for (const auto& ref : extract_log_references(result.stderr_lines)) {
            fs::path path{ref.path};
            if (path.is_relative()) {
                path = ws.root() / path;
            }
            auto section = detail::read_log(path);
            if (!section.available) {
                debug_log("referenced log ", section.path, " unavailable: ", section.error);
            }
            report.logs.push_back(std::move(section));
        }
        return report;
    }

    std::string render_report(const diagnostic_report& report, output_mode mode) {
        if (mode == output_mode::json) {
            std::string json{};
            if (auto ec = glz::write_json(report, json)) {
                return "failed to serialize diagnostic report as json; exit code was {}"_format(report.exit_code);
            }
            return json;
        }

        std::ostringstream os{};
        detail::render_text(report, os);
        return os.str();
    }

}  // namespace rigor
