#include "dtex/driver.hpp"

#include "dtex/format.hpp"
#include "dtex/utils.hpp"

#include "internal/process.hpp"

#include <utility>

using namespace dtex::literals;

namespace dtex {

    std::vector<std::string> make_engine_args(const workspace& ws, const std::vector<std::string>& passthrough) {
        std::vector<std::string> args{};
        args.reserve(passthrough.size() + 2U);
        args.emplace_back(output_directory_flag);
        args.push_back(ws.dir().string());
        args.insert(args.end(), passthrough.begin(), passthrough.end());
        return args;
    }

    compile_driver::compile_driver(
            std::string engine, std::vector<std::string> args, convergence_tracker& tracker, int max_passes)
            : engine_(std::move(engine)), args_(std::move(args)), tracker_(tracker), max_passes_(max_passes) {}

    result<void> compile_driver::compile_once() {
        std::vector<std::string> command{};
        command.reserve(args_.size() + 1U);
        command.push_back(engine_);
        command.insert(command.end(), args_.begin(), args_.end());

        trace_log{"running ", utils::join_with_separator(command, " "sv)};
        auto proc = internal::run_process(command);
        if (!proc) {
            return std::unexpected{proc.error()};
        }
        if (proc->exit_code != 0) {
            return compile_error(
                    "{} exited with status {}"_format(engine_, proc->exit_code), std::move(proc->output));
        }
        return {};
    }

    result<compile_outcome> compile_driver::run() {
        state_ = compile_state::idle;
        passes_ = 0;

        while (tracker_.changed() && passes_ < max_passes_) {
            state_ = compile_state::compiling;
            trace_log{"compile iteration ", passes_};
            if (auto res = compile_once(); !res) {
                state_ = compile_state::failed;
                return std::unexpected{res.error()};
            }

            state_ = compile_state::snapshotting;
            trace_log{"updating hashes"};
            if (auto res = tracker_.update(); !res) {
                state_ = compile_state::failed;
                return std::unexpected{res.error()};
            }
            ++passes_;
        }

        state_ = tracker_.changed() ? compile_state::ceiling_reached : compile_state::converged;
        trace_log{"compilation finished: {} after {} pass(es)"_format(state_, passes_)};
        return compile_outcome{state_, passes_};
    }

}  // namespace dtex
