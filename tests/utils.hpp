#pragma once

#include "plotgate.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace plotgate::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline std::string read_file(const fs::path& p) {
        std::ifstream in{p, std::ios::binary};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p, std::ios::binary};
        REQUIRE(out.good());
        out << content;
    }

    inline constexpr auto probe_prefix = "probe "sv;

    // Records every command; probe commands and render commands get separate exit codes
    struct recording_shell {
        std::vector<std::string> commands{};
        int render_exit{0};
        int probe_exit{0};
        std::string render_output{};

        shell_result operator()(const std::string& command) {
            commands.push_back(command);
            if (command.starts_with(probe_prefix)) {
                return {probe_exit, {}};
            }
            return {render_exit, render_output};
        }

        size_t probe_count() const {
            return static_cast<size_t>(std::ranges::count_if(
                    commands, [](const std::string& c) { return c.starts_with(probe_prefix); }));
        }

        size_t render_count() const { return commands.size() - probe_count(); }
    };

    // Profile with recognizable fragment and command text; nothing here touches a real toolkit
    inline toolkit_profile fake_profile(toolkit kit, capture_position capture = capture_position::append) {
        toolkit_profile profile{};
        profile.kit = kit;
        profile.default_executable = "fake-exe";
        profile.script_extension = ".fake";
        profile.capture = capture;
        profile.capture_fragment = [](const figure_spec&, const fs::path& figure_path) {
            return "#capture " + figure_path.string();
        };
        profile.command_line = [](const output_spec& out, std::string_view executable) {
            return std::string{executable} + " run " + out.script_path.string() + " " + out.figure_path.string();
        };
        profile.probe_command = [](std::string_view executable) {
            return std::string{probe_prefix} + std::string{executable};
        };
        return profile;
    }

    struct fake_environment {
        temp_dir temp;
        toolkit_registry registry{default_registry()};
        recording_shell shell{};
        std::vector<std::string> log_lines{};
        execution_context ctx{};

        explicit fake_environment(std::string_view prefix) : temp{prefix} {
            ctx.config.temp_dir = temp.path / "scripts";
            ctx.toolkits = &registry;
            ctx.shell = std::ref(shell);
            ctx.log = [this](log_level level, std::string_view message) {
                log_lines.push_back(std::string{to_string(level)} + ": " + std::string{message});
            };
        }

        fake_environment(const fake_environment&) = delete;
        fake_environment& operator=(const fake_environment&) = delete;

        void install(toolkit_profile profile) { registry.set(std::move(profile)); }

        figure_spec make_spec(toolkit kit, std::string script, save_format format = save_format::png) const {
            figure_spec spec{};
            spec.kit = kit;
            spec.script = std::move(script);
            spec.format = format;
            spec.directory = temp.path / "out";
            return spec;
        }
    };

}  // namespace plotgate::test::detail
