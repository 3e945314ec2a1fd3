#include "plotgate/toolkit.hpp"

#include "plotgate/format.hpp"

namespace fs = std::filesystem;
using namespace plotgate::literals;

namespace plotgate {

    namespace detail {

        static bool attr_enabled(const figure_spec& spec, std::string_view name) {
            auto it = spec.extra_attrs.find(std::string{name});
            if (it == spec.extra_attrs.end()) {
                return false;
            }
            return utils::str_case_eq(it->second, "true"sv) || utils::str_case_eq(it->second, "yes"sv) ||
                   it->second == "1"sv;
        }

        static std::string command_exists_probe(std::string_view executable) {
            return "command -v {} >/dev/null 2>&1"_format(executable);
        }

        static std::string interpreter_command(const output_spec& out, std::string_view executable) {
            return "{} \"{}\""_format(executable, out.script_path.string());
        }

        static constexpr std::string_view gnuplot_terminal(save_format format) {
            switch (format) {
                case save_format::png:
                    return "pngcairo"sv;
                case save_format::pdf:
                    return "pdfcairo"sv;
                case save_format::svg:
                    return "svg"sv;
                case save_format::jpg:
                    return "jpeg"sv;
                case save_format::eps:
                    return "postscript eps"sv;
                case save_format::gif:
                    return "gif"sv;
                case save_format::html:
                    return "canvas"sv;
                case save_format::tif:
                case save_format::webp:
                    // no native terminal; bytes are PNG
                    return "pngcairo"sv;
            }
            return "pngcairo"sv;
        }

    }  // namespace detail

    toolkit_profile make_matplotlib_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::matplotlib;
        profile.default_executable = "python3";
        profile.script_extension = ".py";
        profile.capture = capture_position::append;
        profile.checks.push_back(forbid_pattern(
                R"((\bplt|\bpyplot|matplotlib\.pyplot)\s*\.\s*show\s*\()",
                "encountered a call to `matplotlib.pyplot.show`; figures are saved automatically"));
        profile.capture_fragment = [](const figure_spec& spec, const fs::path& figure_path) {
            auto transparent = detail::attr_enabled(spec, "transparent"sv) ? "True"sv : "False"sv;
            auto bbox = detail::attr_enabled(spec, "tight_bbox"sv) ? "'tight'"sv : "None"sv;
            return "import matplotlib.pyplot as plt\n"
                   "plt.savefig(r\"{}\", dpi={}, transparent={}, bbox_inches={})\n"_format(
                           figure_path.string(), spec.dpi, transparent, bbox);
        };
        profile.command_line = detail::interpreter_command;
        profile.probe_command = [](std::string_view executable) {
            return "{} -c \"import matplotlib\""_format(executable);
        };
        return profile;
    }

    toolkit_profile make_plotly_python_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::plotly_python;
        profile.default_executable = "python3";
        profile.script_extension = ".py";
        profile.capture = capture_position::append;
        profile.checks.push_back(forbid_pattern(
                R"(\.\s*show\s*\(\s*\))", "encountered a call to `show()`; figures are saved automatically"));
        profile.capture_fragment = [](const figure_spec& spec, const fs::path& figure_path) {
            auto writer = spec.format == save_format::html
                                ? "write_html(r\"{}\", include_plotlyjs=\"cdn\")"_format(figure_path.string())
                                : "write_image(r\"{}\")"_format(figure_path.string());
            return "import plotly.graph_objects as go\n"
                   "__plotgate_figure = next(obj for obj in reversed(list(globals().values())) "
                   "if type(obj) == go.Figure)\n"
                   "__plotgate_figure.{}\n"_format(writer);
        };
        profile.command_line = detail::interpreter_command;
        profile.probe_command = [](std::string_view executable) {
            return "{} -c \"import plotly.graph_objects\""_format(executable);
        };
        return profile;
    }

    toolkit_profile make_matlab_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::matlab;
        profile.default_executable = "matlab";
        profile.script_extension = ".m";
        profile.capture = capture_position::append;
        profile.capture_fragment = [](const figure_spec&, const fs::path& figure_path) {
            return "saveas(gcf, '{}')\n"_format(figure_path.string());
        };
        profile.command_line = [](const output_spec& out, std::string_view executable) {
            return "{} -batch \"run('{}')\""_format(executable, out.script_path.string());
        };
        profile.probe_command = detail::command_exists_probe;
        return profile;
    }

    toolkit_profile make_mathematica_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::mathematica;
        profile.default_executable = "math";
        profile.script_extension = ".m";
        profile.capture = capture_position::append;
        profile.capture_fragment = [](const figure_spec& spec, const fs::path& figure_path) {
            return "Export[\"{}\", %, ImageResolution -> {}]\n"_format(figure_path.string(), spec.dpi);
        };
        profile.command_line = [](const output_spec& out, std::string_view executable) {
            return "{} -script \"{}\""_format(executable, out.script_path.string());
        };
        profile.probe_command = detail::command_exists_probe;
        return profile;
    }

    toolkit_profile make_octave_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::octave;
        profile.default_executable = "octave";
        profile.script_extension = ".m";
        profile.capture = capture_position::append;
        profile.capture_fragment = [](const figure_spec&, const fs::path& figure_path) {
            return "saveas(gcf, '{}')\n"_format(figure_path.string());
        };
        profile.command_line = [](const output_spec& out, std::string_view executable) {
            return "{} --no-gui --no-window-system \"{}\""_format(executable, out.script_path.string());
        };
        profile.probe_command = detail::command_exists_probe;
        return profile;
    }

    toolkit_profile make_ggplot2_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::ggplot2;
        profile.default_executable = "Rscript";
        profile.script_extension = ".r";
        profile.capture = capture_position::append;
        profile.capture_fragment = [](const figure_spec& spec, const fs::path& figure_path) {
            return "library(ggplot2)\nggsave(\"{}\", dpi = {})\n"_format(figure_path.string(), spec.dpi);
        };
        profile.command_line = detail::interpreter_command;
        profile.probe_command = [](std::string_view executable) {
            return "{} -e \"library(ggplot2)\" >/dev/null 2>&1"_format(executable);
        };
        return profile;
    }

    toolkit_profile make_gnuplot_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::gnuplot;
        profile.default_executable = "gnuplot";
        profile.script_extension = ".gp";
        // terminal and output must be set before the first plot command
        profile.capture = capture_position::prepend;
        profile.capture_fragment = [](const figure_spec& spec, const fs::path& figure_path) {
            return "set terminal {}\nset output '{}'\n"_format(
                    detail::gnuplot_terminal(spec.format), figure_path.string());
        };
        profile.command_line = [](const output_spec& out, std::string_view executable) {
            return "{} -c \"{}\""_format(executable, out.script_path.string());
        };
        profile.probe_command = detail::command_exists_probe;
        return profile;
    }

    toolkit_profile make_graphviz_profile() {
        toolkit_profile profile{};
        profile.kit = toolkit::graphviz;
        profile.default_executable = "dot";
        profile.script_extension = ".dot";
        profile.capture = capture_position::append;
        // output path is passed on the command line
        profile.capture_fragment = [](const figure_spec&, const fs::path&) { return std::string{}; };
        profile.command_line = [](const output_spec& out, std::string_view executable) {
            return "{} -T{} -o \"{}\" \"{}\""_format(
                    executable, extension(out.spec.format), out.figure_path.string(), out.script_path.string());
        };
        profile.probe_command = detail::command_exists_probe;
        return profile;
    }

    const toolkit_registry& default_registry() {
        static const toolkit_registry registry = [] {
            toolkit_registry r{};
            r.set(make_matplotlib_profile());
            r.set(make_plotly_python_profile());
            r.set(make_matlab_profile());
            r.set(make_mathematica_profile());
            r.set(make_octave_profile());
            r.set(make_ggplot2_profile());
            r.set(make_gnuplot_profile());
            r.set(make_graphviz_profile());
            return r;
        }();
        return registry;
    }

    std::string resolve_executable(const runner_config& cfg, const toolkit_profile& profile) {
        if (auto it = cfg.executables.find(profile.kit); it != cfg.executables.end() && !it->second.empty()) {
            return it->second;
        }
        return profile.default_executable;
    }

    std::string instrument_script(const toolkit_profile& profile, const figure_spec& spec, const fs::path& figure_path) {
        auto fragment = profile.capture_fragment ? profile.capture_fragment(spec, figure_path) : std::string{};
        if (profile.capture == capture_position::prepend) {
            return "{}\n{}"_format(fragment, spec.script);
        }
        return "{}\n{}"_format(spec.script, fragment);
    }

}  // namespace plotgate
