#pragma once

#include "config.hpp"
#include "error.hpp"
#include "tracker.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dtex {

    enum class compile_state : uint8_t {
        idle,
        compiling,
        snapshotting,
        converged,
        ceiling_reached,
        failed,
    };

    inline constexpr std::string_view to_string(compile_state state) {
        switch (state) {
            case compile_state::idle:
                return "idle"sv;
            case compile_state::compiling:
                return "compiling"sv;
            case compile_state::snapshotting:
                return "snapshotting"sv;
            case compile_state::converged:
                return "converged"sv;
            case compile_state::ceiling_reached:
                return "ceiling_reached"sv;
            case compile_state::failed:
                return "failed"sv;
        }
        return "idle"sv;
    }

    inline constexpr bool is_terminal(compile_state state) {
        return state == compile_state::converged || state == compile_state::ceiling_reached ||
               state == compile_state::failed;
    }

    struct compile_outcome {
        compile_state state{compile_state::idle};
        int passes{};

        bool converged() const { return state == compile_state::converged; }
    };

    inline constexpr auto output_directory_flag = "-output-directory"sv;

    // -output-directory <ws.dir()> followed by the pass-through arguments
    std::vector<std::string> make_engine_args(const workspace& ws, const std::vector<std::string>& passthrough);

    /*
     * Runs the engine until the tracker stops reporting changes or `max_passes` successful
     * passes have run. A pass that exits non-zero ends the run with compile_error and the
     * tracker is not updated for it.
     */
    class compile_driver {
      public:
        compile_driver(
                std::string engine,
                std::vector<std::string> args,
                convergence_tracker& tracker,
                int max_passes = max_compile_passes);

        result<compile_outcome> run();

        compile_state state() const { return state_; }
        int passes() const { return passes_; }
        const std::vector<std::string>& args() const { return args_; }

      private:
        result<void> compile_once();

        std::string engine_{};
        std::vector<std::string> args_{};
        convergence_tracker& tracker_;
        int max_passes_{max_compile_passes};
        int passes_{};
        compile_state state_{compile_state::idle};
    };

}  // namespace dtex
