#pragma once

#include "config.hpp"
#include "driver.hpp"
#include "error.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace dtex::session {

    struct run_report {
        int schema_version{1};
        std::string document{};
        std::string workspace{};
        std::string engine{};
        int passes{};
        std::string state{};
        bool converged{};
        std::string output{};
    };

    // -output-directory is injected by the driver; any user spelling of it is reserved
    bool is_output_directory_arg(std::string_view arg);

    result<void> validate_engine_args(const std::vector<std::string>& args);

    // Resolver -> tracker -> driver -> finalizer. The ceiling warning goes to `err`.
    result<run_report> compile_document(const startup_config& cfg, std::ostream& err);

    result<void> clean(const startup_config& cfg);

    std::string serialize_report(const run_report& report);

    // Runs cfg.mode and maps the first fatal error to an exit code (0 or 1)
    int execute(const startup_config& cfg, std::ostream& out, std::ostream& err);

}  // namespace dtex::session
