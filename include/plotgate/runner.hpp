#pragma once

#include "config.hpp"
#include "figure.hpp"
#include "process.hpp"
#include "result.hpp"
#include "toolkit.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace plotgate {

    inline constexpr auto temp_script_prefix = "plotgate_"sv;

    using log_sink = std::function<void(log_level, std::string_view)>;

    // Writes "[level] message" lines to `os` for levels at or above `threshold`
    log_sink make_stream_sink(std::ostream& os, log_level threshold);

    /*
     * Everything a pipeline run reads. Not mutated during a run, so one context may be
     * shared by concurrent calls as long as the registry, executor and sink are
     * themselves thread-safe (the defaults are).
     */
    struct execution_context {
        runner_config config{};
        const toolkit_registry* toolkits{&default_registry()};
        shell_executor shell{run_shell};
        log_sink log{};

        const toolkit_profile& profile(toolkit kit) const { return toolkits->at(kit); }

        void emit(log_level level, std::string_view message) const {
            if (log) {
                log(level, message);
            }
        }
    };

    // Context with the default registry and real shell, logging to stderr at cfg.level
    execution_context make_context(runner_config cfg);

    // <temp dir>/plotgate_<script hash><toolkit extension>
    std::filesystem::path script_path(const execution_context& ctx, const figure_spec& spec);

    output_spec make_output_spec(const execution_context& ctx, const figure_spec& spec);

    // Live probe; never cached
    bool toolkit_available(const execution_context& ctx, toolkit kit);

    script_result classify(const execution_context& ctx, int exit_code, std::string command, toolkit kit);

    /**
     * Folds the toolkit's checks, then writes the instrumented script and runs it.
     * Does not look at the artifact path and does not write the transcript.
     */
    script_result run_temp_script(const execution_context& ctx, const figure_spec& spec);

    /**
     * Cache gate. Creates the output directory, returns success without spawning
     * anything when the figure already exists, and otherwise defers to
     * run_temp_script(). On success the transcript is (re)written next to the figure.
     *
     * Throws std::runtime_error on file-system failures and spawn_error when the
     * shell cannot be started.
     */
    script_result run_script_if_necessary(const execution_context& ctx, const figure_spec& spec);

    // Writes spec.script verbatim to transcript_path(figure_path(spec))
    void write_transcript(const figure_spec& spec);

}  // namespace plotgate
