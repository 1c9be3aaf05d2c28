#pragma once

#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef DTEX_DEFAULT_ENGINE
#define DTEX_DEFAULT_ENGINE "pdflatex"
#endif

namespace dtex {

    using namespace std::string_view_literals;

    /*
     * dtex Startup Config Options
     *
     * Workspace
     * - temp_root: Root of all per-document workspaces (<system temp>/dtex by default).
     *   Built once here and handed to the resolver and the clean routine.
     *
     * Engine
     * - engine: Engine binary, resolved through PATH. TEX overrides the default,
     *   --engine overrides TEX.
     * - engine_args: Pass-through engine arguments in command-line order; the last one
     *   names the document.
     * - output_extension: Extension of the artifact relocated next to the document.
     *
     * UX
     * - verbose: Trace logging to stderr (VERBOSE or --verbose). No effect on behavior.
     * - output: Shape of the success report ("table" prints nothing, "json" prints a run report).
     * - print_config: Print resolved config and exit.
     *
     * Mode
     * - mode: compile a document, or remove temp_root entirely (-clean).
     */

    enum class output_mode { table, json };
    enum class command_mode { compile, clean };

    inline constexpr int max_compile_passes = 5;

    inline constexpr auto source_extension = ".tex"sv;
    inline constexpr auto log_extension = ".log"sv;
    inline constexpr auto default_output_extension = ".pdf"sv;
    inline constexpr auto default_engine = std::string_view{DTEX_DEFAULT_ENGINE};

    namespace env {
        inline constexpr auto verbose = "VERBOSE"sv;
        inline constexpr auto engine = "TEX"sv;
    }  // namespace env

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(command_mode mode) {
        switch (mode) {
            case command_mode::compile:
                return "compile"sv;
            case command_mode::clean:
                return "clean"sv;
        }
        return "compile"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline std::filesystem::path default_temp_root() {
        std::error_code ec{};
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }
        return base / "dtex";
    }

    struct startup_config {
        std::filesystem::path temp_root{default_temp_root()};
        std::string engine{default_engine};
        std::vector<std::string> engine_args{};
        std::string output_extension{default_output_extension};

        bool verbose{false};
        output_mode output{output_mode::table};
        bool print_config{false};

        command_mode mode{command_mode::compile};
    };

    inline void apply_environment(startup_config& cfg) {
        if (auto* value = std::getenv(env::verbose.data()); value != nullptr && *value != '\0') {
            cfg.verbose = true;
        }
        if (auto* value = std::getenv(env::engine.data()); value != nullptr && *value != '\0') {
            cfg.engine = value;
        }
    }

}  // namespace dtex
