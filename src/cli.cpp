#include "dtex/cli.hpp"

#include "dtex/format.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifndef DTEX_VERSION
#define DTEX_VERSION "0.0.0"
#endif

using namespace dtex::literals;

namespace dtex::cli { namespace detail {

    using namespace std::string_view_literals;

    inline constexpr auto clean_flag = "-clean"sv;

    struct config_record {
        std::string temp_root{};
        std::string engine{};
        std::string output_extension{};
        std::string output{};
        bool verbose{};
    };

    static config_record make_config_record(const startup_config& cfg) {
        config_record data{};
        data.temp_root = cfg.temp_root.string();
        data.engine = cfg.engine;
        data.output_extension = cfg.output_extension;
        data.output = std::string{to_string(cfg.output)};
        data.verbose = cfg.verbose;
        return data;
    }

    static void print_config(const startup_config& cfg, std::ostream& os) {
        if (cfg.output == output_mode::json) {
            std::string json{};
            if (auto ec = glz::write_json(make_config_record(cfg), json)) {
                throw std::runtime_error("failed to serialize config");
            }
            os << json << '\n';
            return;
        }
        os << "temp_root=" << cfg.temp_root.string() << '\n';
        os << "engine=" << cfg.engine << '\n';
        os << "output_ext=" << cfg.output_extension << '\n';
        os << "output=" << to_string(cfg.output) << '\n';
        os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
    }

    static std::string usage_footer() {
        return "\nUsage: dtex [options] [tex options] file.tex\n"
               "\n"
               "will compile file.tex as many times as necessary: until all the generated\n"
               "temporary files don't change anymore, with a maximum of {} compilations.\n"
               "Arguments not listed above are passed to the engine unchanged.\n"
               "\n"
               "Usage: dtex -clean\n"
               "\n"
               "will remove all temporary files used by this program.\n"
               "\n"
               "Environment: VERBOSE=1 enables tracing, TEX overrides the engine ({})."_format(
                       max_compile_passes, default_engine);
    }

}}  // namespace dtex::cli::detail

namespace dtex::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        apply_environment(cfg);

        CLI::App app{"dtex: TeX compiler wrapper", "dtex"};
        // no short options: single-dash engine flags (-halt-on-error, ...) must fall through
        app.set_help_flag("--help", "Print this help message and exit");
        app.allow_extras();
        app.footer(detail::usage_footer());

        bool show_version = false;
        std::string temp_root_arg{cfg.temp_root.string()};
        std::string output_arg{std::string{to_string(cfg.output)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_flag("--verbose", cfg.verbose, "Trace workspace, hashing and engine runs to stderr");
        app.add_option("--engine", cfg.engine, "Engine executable (default: $TEX or pdflatex)");
        app.add_option("--temp-root", temp_root_arg, "Root directory of per-document workspaces");
        app.add_option("--output-ext", cfg.output_extension, "Extension of the relocated output artifact");
        app.add_option("--output", output_arg, "Report mode: table|json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            auto code = app.exit(e);
            return std::optional<int>{code == 0 ? 0 : 1};
        }

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{1};
        }
        if (temp_root_arg.empty()) {
            std::cerr << "--temp-root must not be empty\n";
            return std::optional<int>{1};
        }
        cfg.temp_root = temp_root_arg;
        if (!cfg.output_extension.empty() && cfg.output_extension.front() != '.') {
            cfg.output_extension.insert(cfg.output_extension.begin(), '.');
        }

        if (show_version) {
            std::cout << "dtex " << DTEX_VERSION << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        cfg.engine_args = app.remaining();
        if (cfg.engine_args.empty()) {
            std::cerr << app.help();
            return std::optional<int>{1};
        }

        if (std::ranges::find(cfg.engine_args, detail::clean_flag) != cfg.engine_args.end()) {
            if (cfg.engine_args.size() != 1U) {
                std::cerr << "\"" << detail::clean_flag << "\" takes no other arguments\n";
                return std::optional<int>{1};
            }
            cfg.engine_args.clear();
            cfg.mode = command_mode::clean;
        }

        return std::nullopt;
    }

}  // namespace dtex::cli
