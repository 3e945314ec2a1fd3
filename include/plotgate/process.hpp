#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace plotgate {

    // The shell itself could not be started. Never folded into a script_result.
    class spawn_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    struct shell_result {
        int exit_code{-1};
        // stdout and stderr interleaved through one pipe
        std::string output{};
    };

    using shell_executor = std::function<shell_result(const std::string& command)>;

    /**
     * Runs `command` through the platform shell (`sh -c`) and blocks until it exits.
     * Signal termination is reported as 128 + signal number.
     *
     * Throws spawn_error when the pipe, fork or shell exec fails.
     */
    shell_result run_shell(const std::string& command);

}  // namespace plotgate
