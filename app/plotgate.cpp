#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        plotgate::cli::invocation inv{};
        if (auto cli_result = plotgate::cli::parse_cli(argc, argv, inv)) {
            return *cli_result;
        }

        return plotgate::cli::run(inv);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
