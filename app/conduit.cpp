#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        conduit::startup_config cfg{};
        conduit::cli::command_request cmd{};
        if (auto cli_result = conduit::cli::parse_cli(argc, argv, cfg, cmd)) {
            return *cli_result;
        }

        return conduit::cli::execute(cmd, cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
