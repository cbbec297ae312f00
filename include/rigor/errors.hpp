#pragma once

#include "format.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rigor {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        io_failure,
        resource_not_found,
        launch_failure,
        config_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::io_failure:
                return "io failure"sv;
            case error_kind::resource_not_found:
                return "resource not found"sv;
            case error_kind::launch_failure:
                return "launch failure"sv;
            case error_kind::config_error:
                return "config error"sv;
        }
        return "io failure"sv;
    }

    /*
     * Fatal harness errors. None of these are retried; a nonzero exit code
     * from the tool under test is a normal command_result, never an error.
     */
    class harness_error : public std::runtime_error {
      public:
        harness_error(error_kind kind, std::string_view message)
                : std::runtime_error{std::format("{}: {}", kind, message)}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

    // Filesystem read/write/permission error in the workspace or while copying.
    class io_failure : public harness_error {
      public:
        explicit io_failure(std::string_view message) : harness_error{error_kind::io_failure, message} {}
    };

    // A logical resource could not be resolved to an existing path.
    class resource_not_found : public harness_error {
      public:
        explicit resource_not_found(std::string_view message)
                : harness_error{error_kind::resource_not_found, message} {}
    };

    // The executable never started; distinct from "ran and exited nonzero".
    class launch_failure : public harness_error {
      public:
        explicit launch_failure(std::string_view message) : harness_error{error_kind::launch_failure, message} {}
    };

    class config_error : public harness_error {
      public:
        explicit config_error(std::string_view message) : harness_error{error_kind::config_error, message} {}
    };

}  // namespace rigor
