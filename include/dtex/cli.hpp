#pragma once

#include "config.hpp"

#include <optional>

namespace dtex::cli {

    // Returns an exit code when the invocation is fully handled (help, version, usage error)
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

}  // namespace dtex::cli
