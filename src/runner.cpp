#include "plotgate/runner.hpp"

#include "plotgate/format.hpp"

#include <fstream>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace plotgate::literals;

namespace plotgate {

    namespace detail {

        static void ensure_dir(const fs::path& path) {
            if (path.empty()) {
                return;
            }
            std::error_code ec{};
            fs::create_directories(path, ec);
            if (ec) {
                throw std::runtime_error("failed to create directory: {} ({})"_format(path.string(), ec.message()));
            }
        }

        // binary mode: transcripts and scripts must hold the exact bytes
        static void write_file(const fs::path& path, std::string_view text) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
            }
            out.write(text.data(), static_cast<std::streamsize>(text.size()));
            if (!out) {
                throw std::runtime_error("failed to write file: {}"_format(path.string()));
            }
        }

        static bool figure_exists(const fs::path& path) {
            std::error_code ec{};
            auto exists = fs::exists(path, ec);
            if (ec) {
                throw std::runtime_error("failed to stat {}: {}"_format(path.string(), ec.message()));
            }
            return exists;
        }

        static fs::path temp_root(const runner_config& cfg) {
            if (cfg.temp_dir && !cfg.temp_dir->empty()) {
                return *cfg.temp_dir;
            }
            return fs::temp_directory_path();
        }

    }  // namespace detail

    log_sink make_stream_sink(std::ostream& os, log_level threshold) {
        return [&os, threshold](log_level level, std::string_view message) {
            if (threshold == log_level::off || level < threshold) {
                return;
            }
            os << '[' << to_string(level) << "] " << message;
            if (!message.ends_with('\n')) {
                os << '\n';
            }
            os.flush();
        };
    }

    execution_context make_context(runner_config cfg) {
        execution_context ctx{};
        ctx.log = make_stream_sink(std::cerr, cfg.level);
        ctx.config = std::move(cfg);
        return ctx;
    }

    fs::path script_path(const execution_context& ctx, const figure_spec& spec) {
        const auto& profile = ctx.profile(spec.kit);
        auto name = "{}{}{}"_format(temp_script_prefix, script_hash(spec.script), profile.script_extension);
        return (detail::temp_root(ctx.config) / name).lexically_normal();
    }

    output_spec make_output_spec(const execution_context& ctx, const figure_spec& spec) {
        return output_spec{spec, script_path(ctx, spec), figure_path(spec)};
    }

    bool toolkit_available(const execution_context& ctx, toolkit kit) {
        const auto& profile = ctx.profile(kit);
        if (!profile.probe_command) {
            ctx.emit(log_level::warning, "no availability probe for {}; assuming installed"_format(kit));
            return true;
        }

        auto probe = profile.probe_command(resolve_executable(ctx.config, profile));
        debug_log("probing ", to_string(kit), ": ", probe);
        auto result = ctx.shell(probe);
        return result.exit_code == 0;
    }

    script_result classify(const execution_context& ctx, int exit_code, std::string command, toolkit kit) {
        if (exit_code == 0) {
            return script_success{};
        }
        if (!toolkit_available(ctx, kit)) {
            return toolkit_not_installed{kit};
        }
        return script_failure{std::move(command), exit_code};
    }

    script_result run_temp_script(const execution_context& ctx, const figure_spec& spec) {
        const auto& profile = ctx.profile(spec.kit);

        auto checked = fold_checks(profile.checks, spec.script);
        if (!checked.ok()) {
            ctx.emit(log_level::warning, "{} script rejected by checks:\n{}"_format(spec.kit, *checked.failure));
            return script_checks_failed{std::move(*checked.failure)};
        }

        auto out = make_output_spec(ctx, spec);
        detail::ensure_dir(out.script_path.parent_path());
        detail::write_file(out.script_path, instrument_script(profile, spec, out.figure_path));

        auto command = profile.command_line(out, resolve_executable(ctx.config, profile));
        ctx.emit(log_level::info, "running: {}"_format(command));

        auto [exit_code, output] = ctx.shell(command);
        if (!output.empty()) {
            ctx.emit(exit_code == 0 ? log_level::debug : log_level::error, output);
        }

        auto result = classify(ctx, exit_code, std::move(command), spec.kit);
        if (!succeeded(result)) {
            ctx.emit(log_level::error, describe(result));
        }
        return result;
    }

    script_result run_script_if_necessary(const execution_context& ctx, const figure_spec& spec) {
        auto target = figure_path(spec);
        detail::ensure_dir(target.parent_path());

        script_result result{script_success{}};
        if (detail::figure_exists(target)) {
            ctx.emit(log_level::debug, "{} exists; skipping {} run"_format(target.string(), spec.kit));
        }
        else {
            result = run_temp_script(ctx, spec);
        }

        if (succeeded(result)) {
            write_transcript(spec);
        }
        return result;
    }

    void write_transcript(const figure_spec& spec) {
        auto path = transcript_path(figure_path(spec));
        detail::ensure_dir(path.parent_path());
        detail::write_file(path, spec.script);
    }

}  // namespace plotgate
