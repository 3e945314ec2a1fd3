#pragma once

#include "plotgate.hpp"

#include <optional>

namespace plotgate::cli {

    struct invocation {
        runner_config cfg{};
        figure_spec spec{};
    };

    // Fills `inv` from argv; returns an exit code when the process should stop here
    std::optional<int> parse_cli(int argc, char** argv, invocation& inv);

    int run(const invocation& inv);

    int exit_code_for(const script_result& result);

    // ANSI color for the table report; `automatic` follows whether stdout is a terminal
    bool should_colorize(color_mode mode, bool is_terminal);

}  // namespace plotgate::cli
