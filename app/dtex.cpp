#include "dtex/cli.hpp"
#include "dtex/session.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        dtex::startup_config cfg{};
        if (auto cli_result = dtex::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return dtex::session::execute(cfg, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
