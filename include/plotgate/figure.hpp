#pragma once

#include "config.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plotgate {

    inline constexpr int default_dpi = 80;
    inline constexpr auto transcript_extension = ".txt"sv;

    // One figure request. Built once by the caller and only read afterwards.
    struct figure_spec {
        toolkit kit{toolkit::matplotlib};
        std::string script{};
        save_format format{save_format::png};
        std::filesystem::path directory{};
        int dpi{default_dpi};
        // toolkit-specific rendering options; these change the rendered bytes
        std::map<std::string, std::string> extra_attrs{};

        // presentation metadata, owned by the document layer and not hashed
        std::vector<std::pair<std::string, std::string>> block_attrs{};
        std::string caption{};
        bool with_source{false};
    };

    struct output_spec {
        const figure_spec& spec;
        std::filesystem::path script_path{};
        std::filesystem::path figure_path{};
    };

    /**
     * Hex digest over the fields that affect the rendered artifact: toolkit, script,
     * format, dpi and extra attributes. Caption, block attributes and with_source are
     * excluded so that retitling a figure does not re-render it.
     */
    std::string content_hash(const figure_spec& spec);

    // Hex digest of the script text alone; names the temp script
    std::string script_hash(std::string_view script);

    // <directory>/<content_hash>.<format extension>, lexically normalized
    std::filesystem::path figure_path(const figure_spec& spec);

    std::filesystem::path transcript_path(const std::filesystem::path& figure_path);

}  // namespace plotgate
