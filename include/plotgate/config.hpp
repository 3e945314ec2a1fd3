#pragma once

#include "utils.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace plotgate {

    using namespace std::string_view_literals;

    /*
     * Plotgate Runner Config Options
     *
     * Execution
     * - temp_dir: Directory for instrumented temp scripts; system temp directory when unset.
     * - executables: Per-toolkit interpreter/binary overrides. A toolkit absent from the map
     *   uses its profile's default executable.
     *
     * Reporting
     * - log_level: Minimum level forwarded by the default log sink.
     * - output: Result report shape for the command-line driver ("table" or "json").
     * - color: ANSI color behavior for the table report.
     * - print_paths: Print script/figure/transcript paths and exit.
     */

    enum class toolkit : uint8_t {
        matplotlib,
        plotly_python,
        matlab,
        mathematica,
        octave,
        ggplot2,
        gnuplot,
        graphviz,
    };

    inline constexpr size_t toolkit_count = 8U;

    inline constexpr std::array<toolkit, toolkit_count> all_toolkits{
            toolkit::matplotlib,
            toolkit::plotly_python,
            toolkit::matlab,
            toolkit::mathematica,
            toolkit::octave,
            toolkit::ggplot2,
            toolkit::gnuplot,
            toolkit::graphviz};

    enum class save_format : uint8_t { png, pdf, svg, jpg, eps, gif, tif, webp, html };
    enum class log_level : uint8_t { debug, info, warning, error, off };
    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(toolkit kit) {
        switch (kit) {
            case toolkit::matplotlib:
                return "matplotlib"sv;
            case toolkit::plotly_python:
                return "plotly_python"sv;
            case toolkit::matlab:
                return "matlabplot"sv;
            case toolkit::mathematica:
                return "mathplot"sv;
            case toolkit::octave:
                return "octaveplot"sv;
            case toolkit::ggplot2:
                return "ggplot2"sv;
            case toolkit::gnuplot:
                return "gnuplot"sv;
            case toolkit::graphviz:
                return "graphviz"sv;
        }
        return "matplotlib"sv;
    }

    inline constexpr bool try_parse_toolkit(std::string_view text, toolkit& out) {
        for (auto kit : all_toolkits) {
            if (utils::str_case_eq(text, to_string(kit))) {
                out = kit;
                return true;
            }
        }
        return false;
    }

    // Canonical file extension, without the leading dot
    inline constexpr std::string_view to_string(save_format format) {
        switch (format) {
            case save_format::png:
                return "png"sv;
            case save_format::pdf:
                return "pdf"sv;
            case save_format::svg:
                return "svg"sv;
            case save_format::jpg:
                return "jpg"sv;
            case save_format::eps:
                return "eps"sv;
            case save_format::gif:
                return "gif"sv;
            case save_format::tif:
                return "tif"sv;
            case save_format::webp:
                return "webp"sv;
            case save_format::html:
                return "html"sv;
        }
        return "png"sv;
    }

    inline constexpr std::string_view extension(save_format format) {
        return to_string(format);
    }

    inline constexpr bool try_parse_save_format(std::string_view text, save_format& out) {
        if (utils::str_case_eq(text, "jpeg"sv)) {
            out = save_format::jpg;
            return true;
        }
        if (utils::str_case_eq(text, "tiff"sv)) {
            out = save_format::tif;
            return true;
        }
        for (auto format : {save_format::png,
                            save_format::pdf,
                            save_format::svg,
                            save_format::jpg,
                            save_format::eps,
                            save_format::gif,
                            save_format::tif,
                            save_format::webp,
                            save_format::html}) {
            if (utils::str_case_eq(text, to_string(format))) {
                out = format;
                return true;
            }
        }
        return false;
    }

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warning:
                return "warning"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "warning"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        for (auto level : {log_level::debug, log_level::info, log_level::warning, log_level::error, log_level::off}) {
            if (utils::str_case_eq(text, to_string(level))) {
                out = level;
                return true;
            }
        }
        if (utils::str_case_eq(text, "warn"sv)) {
            out = log_level::warning;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    struct runner_config {
        std::optional<std::filesystem::path> temp_dir{};
        std::unordered_map<toolkit, std::string> executables{};

        log_level level{log_level::warning};
        output_mode output{output_mode::table};
        color_mode color{color_mode::automatic};
        bool print_paths{false};
    };

}  // namespace plotgate
