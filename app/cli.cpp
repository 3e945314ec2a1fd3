#include "cli.hpp"

#include "plotgate/report.hpp"

#include <CLI/CLI.hpp>

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace plotgate::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        static constexpr int exit_usage = 2;

        static std::optional<std::string> read_script(const std::string& source) {
            if (source == "-"sv) {
                return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
            }
            std::ifstream in{source, std::ios::binary};
            if (!in) {
                return std::nullopt;
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static bool apply_attr(figure_spec& spec, std::string_view assignment, std::ostream& err) {
            std::string_view key{};
            std::string_view value{};
            if (!utils::split_assignment(assignment, key, value)) {
                err << "invalid --attr " << assignment << ", expected key=value\n";
                return false;
            }
            spec.extra_attrs[std::string{key}] = std::string{value};
            return true;
        }

        static bool apply_executable(runner_config& cfg, std::string_view assignment, std::ostream& err) {
            std::string_view key{};
            std::string_view value{};
            if (!utils::split_assignment(assignment, key, value)) {
                err << "invalid --exe " << assignment << ", expected toolkit=path\n";
                return false;
            }
            toolkit kit{};
            if (!try_parse_toolkit(key, kit)) {
                err << "unknown toolkit in --exe: " << key << '\n';
                return false;
            }
            cfg.executables[kit] = std::string{value};
            return true;
        }

        static void print_paths(const execution_context& ctx, const figure_spec& spec, std::ostream& os) {
            auto figure = figure_path(spec);
            os << "script=" << script_path(ctx, spec).string() << '\n';
            os << "figure=" << figure.string() << '\n';
            os << "transcript=" << transcript_path(figure).string() << '\n';
        }

        static constexpr std::string_view ansi_green = "\x1b[32m"sv;
        static constexpr std::string_view ansi_red = "\x1b[31m"sv;
        static constexpr std::string_view ansi_reset = "\x1b[0m"sv;

        static void render_result_table(const result_record& record, std::ostream& os, bool color) {
            os << "result:     ";
            if (color) {
                os << (record.result == to_string(script_result_kind::success) ? ansi_green : ansi_red) << record.result
                   << ansi_reset << '\n';
            }
            else {
                os << record.result << '\n';
            }
            os << "toolkit:    " << record.toolkit << '\n';
            os << "figure:     " << record.figure_path << '\n';
            os << "transcript: " << record.transcript_path << '\n';
            if (record.command) {
                os << "command:    " << *record.command << '\n';
            }
            if (record.exit_code) {
                os << "exit code:  " << *record.exit_code << '\n';
            }
            if (record.message) {
                os << "message:    " << *record.message << '\n';
            }
        }

    }  // namespace detail

    bool should_colorize(color_mode mode, bool is_terminal) {
        switch (mode) {
            case color_mode::always:
                return true;
            case color_mode::never:
                return false;
            case color_mode::automatic:
                return is_terminal;
        }
        return false;
    }

    int exit_code_for(const script_result& result) {
        switch (kind_of(result)) {
            case script_result_kind::success:
                return 0;
            case script_result_kind::checks_failed:
                return 3;
            case script_result_kind::failure:
                return 4;
            case script_result_kind::toolkit_not_installed:
                return 5;
        }
        return 1;
    }

    int run(const invocation& inv) {
        auto ctx = make_context(inv.cfg);

        if (inv.cfg.print_paths) {
            detail::print_paths(ctx, inv.spec, std::cout);
            return 0;
        }

        auto result = run_script_if_necessary(ctx, inv.spec);
        auto record = make_result_record(ctx, inv.spec, result);

        if (inv.cfg.output == output_mode::json) {
            std::cout << to_json(record) << '\n';
        }
        else {
            detail::render_result_table(
                    record, std::cout, should_colorize(inv.cfg.color, ::isatty(STDOUT_FILENO) == 1));
        }
        return exit_code_for(result);
    }

    std::optional<int> parse_cli(int argc, char** argv, invocation& inv) {
        CLI::App app{"plotgate: render plotting scripts through a content-addressed cache"};

        bool show_version = false;
        std::string script_arg{};
        std::string toolkit_arg{std::string{to_string(inv.spec.kit)}};
        std::string format_arg{std::string{to_string(inv.spec.format)}};
        std::string directory_arg{"plots"};
        std::string temp_dir_arg{};
        std::string output_arg{std::string{to_string(inv.cfg.output)}};
        std::string log_level_arg{std::string{to_string(inv.cfg.level)}};
        std::string color_arg{std::string{to_string(inv.cfg.color)}};
        std::vector<std::string> attr_args{};
        std::vector<std::string> exe_args{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("script", script_arg, "Script file to render ('-' reads stdin)");
        app.add_option("-t,--toolkit", toolkit_arg, "Toolkit: matplotlib|plotly_python|matlabplot|mathplot|"
                                                    "octaveplot|ggplot2|gnuplot|graphviz");
        app.add_option("-f,--format", format_arg, "Save format: png|pdf|svg|jpg|eps|gif|tif|webp|html");
        app.add_option("-d,--directory", directory_arg, "Output directory for figures");
        app.add_option("--dpi", inv.spec.dpi, "Figure resolution")->check(CLI::PositiveNumber);
        app.add_option("--attr", attr_args, "Toolkit rendering attribute key=value (repeatable)");
        app.add_option("--exe", exe_args, "Executable override toolkit=path (repeatable)");
        app.add_option("--temp-dir", temp_dir_arg, "Directory for instrumented temp scripts");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--log-level", log_level_arg, "Log level: debug|info|warning|error|off");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Disable color output");
        app.add_flag("--print-paths", inv.cfg.print_paths, "Print derived paths and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::Success& e) {
            return std::optional<int>{app.exit(e)};
        } catch (const CLI::ParseError& e) {
            app.exit(e);
            return std::optional<int>{detail::exit_usage};
        }

        if (show_version) {
            std::cout << "plotgate 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!try_parse_toolkit(toolkit_arg, inv.spec.kit)) {
            std::cerr << "invalid --toolkit value: " << toolkit_arg << '\n';
            return std::optional<int>{detail::exit_usage};
        }
        if (!try_parse_save_format(format_arg, inv.spec.format)) {
            std::cerr << "invalid --format value: " << format_arg << '\n';
            return std::optional<int>{detail::exit_usage};
        }
        if (!try_parse_output_mode(output_arg, inv.cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{detail::exit_usage};
        }
        if (!try_parse_log_level(log_level_arg, inv.cfg.level)) {
            std::cerr << "invalid --log-level value: " << log_level_arg
                      << " (expected debug|info|warning|error|off)\n";
            return std::optional<int>{detail::exit_usage};
        }
        if (!try_parse_color_mode(color_arg, inv.cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{detail::exit_usage};
        }
        if (app.get_option("--no-color")->count() > 0U) {
            inv.cfg.color = color_mode::never;
        }
        for (const auto& attr : attr_args) {
            if (!detail::apply_attr(inv.spec, attr, std::cerr)) {
                return std::optional<int>{detail::exit_usage};
            }
        }
        for (const auto& exe : exe_args) {
            if (!detail::apply_executable(inv.cfg, exe, std::cerr)) {
                return std::optional<int>{detail::exit_usage};
            }
        }

        if (script_arg.empty()) {
            std::cerr << "missing script file\n";
            return std::optional<int>{detail::exit_usage};
        }
        auto script = detail::read_script(script_arg);
        if (!script) {
            std::cerr << "failed to read script: " << script_arg << '\n';
            return std::optional<int>{detail::exit_usage};
        }

        inv.spec.script = std::move(*script);
        inv.spec.directory = directory_arg;
        if (!temp_dir_arg.empty()) {
            inv.cfg.temp_dir = detail::fs::path{temp_dir_arg};
        }

        return std::nullopt;
    }

}  // namespace plotgate::cli
