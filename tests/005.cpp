#include "utils.hpp"

namespace dtex::test {

    namespace detail {
        struct driver_fixture {
            temp_dir temp;
            fs::path document;
            fs::path args_path;
            fs::path count_path;
            workspace ws{};

            explicit driver_fixture(std::string_view prefix)
                    : temp{prefix},
                      document{temp.path / "src" / "paper.tex"},
                      args_path{temp.path / "engine-args.txt"},
                      count_path{temp.path / "engine-runs.txt"} {
                fs::create_directories(document.parent_path());
                write_text_file(document, "\\documentclass{article}\n");

                auto resolved = resolve_workspace(temp.path / "root", make_document_identity(document.string()));
                REQUIRE(resolved);
                ws = *resolved;
            }

            fs::path engine(std::string_view body) const {
                return make_stub_engine(temp.path, args_path, count_path, body);
            }

            std::vector<std::string> passthrough() const {
                return {"-interaction=nonstopmode", document.string()};
            }
        };

        static convergence_tracker make_tracker(const workspace& ws) {
            auto tracker = convergence_tracker::create(ws, ".pdf");
            REQUIRE(tracker);
            return std::move(*tracker);
        }
    }  // namespace detail

    TEST_CASE("005: make_engine_args injects the workspace output directory first", "[005][driver]") {
        workspace ws{"/tmp/dtex/srv/docs/paper"};
        auto args = make_engine_args(ws, {"-halt-on-error", "/srv/docs/paper.tex"});
        CHECK(args ==
              std::vector<std::string>{
                      "-output-directory", "/tmp/dtex/srv/docs", "-halt-on-error", "/srv/docs/paper.tex"});
    }

    TEST_CASE("005: artifacts that never settle stop at the ceiling", "[005][driver][ceiling]") {
        detail::driver_fixture fx{"dtex_driver_ceiling"};
        auto engine = fx.engine(detail::unstable_engine_body);
        auto tracker = detail::make_tracker(fx.ws);

        compile_driver driver{engine.string(), make_engine_args(fx.ws, fx.passthrough()), tracker};
        auto outcome = driver.run();

        REQUIRE(outcome);
        CHECK(outcome->state == compile_state::ceiling_reached);
        CHECK(outcome->passes == max_compile_passes);
        CHECK_FALSE(outcome->converged());
        CHECK(driver.state() == compile_state::ceiling_reached);
        CHECK(detail::count_lines(fx.count_path) == 5U);
        CHECK(tracker.changed());
        CHECK(detail::fs::exists(fx.ws.artifact(".pdf")));
    }

    TEST_CASE("005: artifacts stable from the second pass converge after two passes", "[005][driver][converge]") {
        detail::driver_fixture fx{"dtex_driver_converge"};
        auto engine = fx.engine(detail::stable_engine_body);
        auto tracker = detail::make_tracker(fx.ws);

        compile_driver driver{engine.string(), make_engine_args(fx.ws, fx.passthrough()), tracker};
        auto outcome = driver.run();

        REQUIRE(outcome);
        CHECK(outcome->state == compile_state::converged);
        CHECK(outcome->passes == 2);
        CHECK(outcome->converged());
        CHECK(detail::count_lines(fx.count_path) == 2U);
        CHECK_FALSE(tracker.changed());

        auto args = detail::read_lines(fx.args_path);
        REQUIRE(args.size() == 4U);
        CHECK(args[0] == "-output-directory");
        CHECK(args[1] == fx.ws.dir().string());
        CHECK(args[2] == "-interaction=nonstopmode");
        CHECK(args[3] == fx.document.string());
    }

    TEST_CASE("005: a converged workspace from an earlier run still compiles once", "[005][driver][converge]") {
        detail::driver_fixture fx{"dtex_driver_rerun"};
        auto engine = fx.engine(detail::stable_engine_body);

        {
            auto tracker = detail::make_tracker(fx.ws);
            compile_driver driver{engine.string(), make_engine_args(fx.ws, fx.passthrough()), tracker};
            REQUIRE(driver.run());
        }
        detail::fs::remove(fx.count_path);

        auto tracker = detail::make_tracker(fx.ws);
        compile_driver driver{engine.string(), make_engine_args(fx.ws, fx.passthrough()), tracker};
        auto outcome = driver.run();

        REQUIRE(outcome);
        CHECK(outcome->state == compile_state::converged);
        CHECK(outcome->passes == 1);
        CHECK(detail::count_lines(fx.count_path) == 1U);
    }

    TEST_CASE("005: a failing engine stops the loop with compile_error", "[005][driver][failure]") {
        detail::driver_fixture fx{"dtex_driver_failure"};
        auto engine = fx.engine(detail::failing_engine_body);
        auto tracker = detail::make_tracker(fx.ws);

        compile_driver driver{engine.string(), make_engine_args(fx.ws, fx.passthrough()), tracker};
        auto outcome = driver.run();

        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == error_kind::compile_error);
        CHECK(outcome.error().engine_output.find("! Undefined control sequence.") != std::string::npos);
        CHECK(outcome.error().engine_output.find("l.3 \\foo") != std::string::npos);
        CHECK(outcome.error().message.find("exited with status 1") != std::string::npos);
        CHECK(driver.state() == compile_state::failed);
        CHECK(driver.passes() == 0);
        CHECK(detail::count_lines(fx.count_path) == 1U);
    }

    TEST_CASE("005: a missing engine binary is a compile_error", "[005][driver][failure]") {
        detail::driver_fixture fx{"dtex_driver_missing"};
        auto tracker = detail::make_tracker(fx.ws);

        compile_driver driver{
                (fx.temp.path / "no-such-engine").string(), make_engine_args(fx.ws, fx.passthrough()), tracker};
        auto outcome = driver.run();

        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == error_kind::compile_error);
        CHECK(outcome.error().message.find("status 127") != std::string::npos);
    }

    TEST_CASE("005: max_passes bounds the loop", "[005][driver][ceiling]") {
        detail::driver_fixture fx{"dtex_driver_bound"};
        auto engine = fx.engine(detail::unstable_engine_body);
        auto tracker = detail::make_tracker(fx.ws);

        compile_driver driver{engine.string(), make_engine_args(fx.ws, fx.passthrough()), tracker, 2};
        auto outcome = driver.run();

        REQUIRE(outcome);
        CHECK(outcome->state == compile_state::ceiling_reached);
        CHECK(outcome->passes == 2);
        CHECK(detail::count_lines(fx.count_path) == 2U);
    }

}  // namespace dtex::test
