#include "dtex/session.hpp"

#include "dtex/finalizer.hpp"
#include "dtex/format.hpp"
#include "dtex/tracker.hpp"
#include "dtex/utils.hpp"
#include "dtex/workspace.hpp"

#include <glaze/glaze.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

using namespace dtex::literals;

namespace dtex::session {

    bool is_output_directory_arg(std::string_view arg) {
        if (arg.starts_with("--"sv)) {
            arg.remove_prefix(2U);
        }
        else if (arg.starts_with("-"sv)) {
            arg.remove_prefix(1U);
        }
        else {
            return false;
        }

        auto name = output_directory_flag.substr(1U);
        if (!arg.starts_with(name)) {
            return false;
        }
        arg.remove_prefix(name.size());
        return arg.empty() || arg.front() == '=';
    }

    result<void> validate_engine_args(const std::vector<std::string>& args) {
        for (const auto& arg : args) {
            if (is_output_directory_arg(arg)) {
                return usage_error("\"{}\" flag not allowed"_format(output_directory_flag));
            }
        }
        if (args.empty()) {
            return usage_error("no document given");
        }
        return {};
    }

    result<run_report> compile_document(const startup_config& cfg, std::ostream& err) {
        if (auto valid = validate_engine_args(cfg.engine_args); !valid) {
            return std::unexpected{valid.error()};
        }

        auto identity = make_document_identity(cfg.engine_args.back());
        auto ws = resolve_workspace(cfg.temp_root, identity);
        if (!ws) {
            return std::unexpected{ws.error()};
        }

        auto lock = workspace_lock::acquire(*ws);
        if (!lock) {
            return std::unexpected{lock.error()};
        }

        auto tracker = convergence_tracker::create(*ws, cfg.output_extension);
        if (!tracker) {
            return std::unexpected{tracker.error()};
        }

        compile_driver driver{cfg.engine, make_engine_args(*ws, cfg.engine_args), *tracker};
        auto outcome = driver.run();
        if (!outcome) {
            return std::unexpected{outcome.error()};
        }

        if (outcome->state == compile_state::ceiling_reached) {
            err << "warning: {} compilations were maybe insufficient\n"_format(max_compile_passes);
        }

        auto output = finalize_output(*ws, identity, cfg.output_extension);
        if (!output) {
            return std::unexpected{output.error()};
        }

        run_report report{};
        report.document = identity.path.string();
        report.workspace = ws->base.string();
        report.engine = cfg.engine;
        report.passes = outcome->passes;
        report.state = std::string{to_string(outcome->state)};
        report.converged = outcome->converged();
        report.output = output->string();
        return report;
    }

    result<void> clean(const startup_config& cfg) {
        return clean_temp_root(cfg.temp_root);
    }

    std::string serialize_report(const run_report& report) {
        std::string json{};
        auto ec = glz::write_json(report, json);
        if (ec) {
            throw std::runtime_error("failed to serialize run report");
        }
        return json;
    }

    int execute(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        log::set_verbose(cfg.verbose);
        trace_log{"using temporary root: ", cfg.temp_root.string()};

        result<void> status{};
        if (cfg.mode == command_mode::clean) {
            status = clean(cfg);
        }
        else if (auto report = compile_document(cfg, err)) {
            if (cfg.output == output_mode::json) {
                out << serialize_report(*report) << '\n';
            }
        }
        else {
            status = std::unexpected{report.error()};
        }

        if (status) {
            return 0;
        }

        const auto& failure = status.error();
        if (failure.kind == error_kind::compile_error) {
            out << failure.engine_output << std::flush;
        }
        err << "fatal: {}: {}\n"_format(failure.kind, failure.message);
        return 1;
    }

}  // namespace dtex::session
