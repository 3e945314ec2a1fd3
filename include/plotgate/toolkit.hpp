#pragma once

#include "check.hpp"
#include "config.hpp"
#include "figure.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plotgate {

    enum class capture_position : uint8_t { prepend, append };

    inline constexpr std::string_view to_string(capture_position position) {
        switch (position) {
            case capture_position::prepend:
                return "prepend"sv;
            case capture_position::append:
                return "append"sv;
        }
        return "append"sv;
    }

    /*
     * Everything toolkit-specific the execution pipeline needs, as plain data.
     *
     * - script_extension: suffix of the temp script, including the leading dot. Some
     *   interpreters refuse files without a recognizable extension.
     * - capture: whether the capture fragment goes before or after the user script.
     *   Toolkits that need the output directive declared before any plot command use
     *   prepend.
     * - checks: static validations folded before any process is spawned.
     * - capture_fragment: code that saves the current plot to the figure path.
     * - command_line: shell command rendering the temp script with `executable`.
     * - probe_command: shell command exiting 0 iff `executable` can render.
     */
    struct toolkit_profile {
        toolkit kit{toolkit::matplotlib};
        std::string default_executable{};
        std::string script_extension{};
        capture_position capture{capture_position::append};
        std::vector<script_check> checks{};
        std::function<std::string(const figure_spec&, const std::filesystem::path&)> capture_fragment{};
        std::function<std::string(const output_spec&, std::string_view executable)> command_line{};
        std::function<std::string(std::string_view executable)> probe_command{};
    };

    // One profile per toolkit, indexed by the enum value
    class toolkit_registry {
      public:
        toolkit_registry() = default;

        const toolkit_profile& at(toolkit kit) const { return profiles_[static_cast<size_t>(kit)]; }

        void set(toolkit_profile profile) {
            auto index = static_cast<size_t>(profile.kit);
            profiles_[index] = std::move(profile);
        }

      private:
        std::array<toolkit_profile, toolkit_count> profiles_{};
    };

    toolkit_profile make_matplotlib_profile();
    toolkit_profile make_plotly_python_profile();
    toolkit_profile make_matlab_profile();
    toolkit_profile make_mathematica_profile();
    toolkit_profile make_octave_profile();
    toolkit_profile make_ggplot2_profile();
    toolkit_profile make_gnuplot_profile();
    toolkit_profile make_graphviz_profile();

    // Registry populated with every built-in profile
    const toolkit_registry& default_registry();

    // Configured override when present, the profile default otherwise
    std::string resolve_executable(const runner_config& cfg, const toolkit_profile& profile);

    // Instrumented script text: user script and capture fragment joined per the profile's ordering
    std::string instrument_script(
            const toolkit_profile& profile, const figure_spec& spec, const std::filesystem::path& figure_path);

}  // namespace plotgate
