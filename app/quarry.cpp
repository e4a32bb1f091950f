#include "quarry.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        quarry::startup_config cfg{};
        if (auto cli_result = quarry::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return quarry::cli::run(cfg, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
