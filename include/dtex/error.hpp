#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace dtex {

    using namespace std::string_view_literals;

    /*
     * Error taxonomy
     *
     * - usage_error: malformed invocation; nothing on disk has been touched yet.
     * - io_error: directory creation, hashing reads, lock acquisition, final relocation.
     * - compile_error: the engine exited non-zero; `engine_output` holds its combined stdout/stderr.
     *
     * Ceiling exhaustion is not an error; it surfaces as compile_state::ceiling_reached.
     */
    enum class error_kind : uint8_t {
        usage_error,
        io_error,
        compile_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::usage_error:
                return "usage error"sv;
            case error_kind::io_error:
                return "io error"sv;
            case error_kind::compile_error:
                return "compilation error"sv;
        }
        return "io error"sv;
    }

    struct error {
        error_kind kind{error_kind::io_error};
        std::string message{};
        std::string engine_output{};
    };

    template <typename T>
    using result = std::expected<T, error>;

    inline std::unexpected<error> make_error(error_kind kind, std::string message, std::string engine_output = {}) {
        return std::unexpected<error>{error{kind, std::move(message), std::move(engine_output)}};
    }

    inline std::unexpected<error> usage_error(std::string message) {
        return make_error(error_kind::usage_error, std::move(message));
    }

    inline std::unexpected<error> io_error(std::string message) {
        return make_error(error_kind::io_error, std::move(message));
    }

    inline std::unexpected<error> compile_error(std::string message, std::string engine_output) {
        return make_error(error_kind::compile_error, std::move(message), std::move(engine_output));
    }

}  // namespace dtex
