#include "plotgate/figure.hpp"

#include "plotgate/format.hpp"

#include <functional>
#include <sstream>

namespace fs = std::filesystem;
using namespace plotgate::literals;

namespace plotgate {

    namespace detail {
        static std::string to_hex(size_t value) {
            std::ostringstream id{};
            id << std::hex << value;
            return id.str();
        }

        static std::string make_content_key(const figure_spec& spec) {
            std::ostringstream key{};
            key << "toolkit:" << to_string(spec.kit) << '\n';
            key << "format:" << to_string(spec.format) << '\n';
            key << "dpi:" << spec.dpi << '\n';
            for (const auto& [name, value] : spec.extra_attrs) {
                key << "attr:" << name.size() << ':' << name << '=' << value.size() << ':' << value << '\n';
            }
            // length-prefixed so attribute text can never alias script text
            key << "script:" << spec.script.size() << ':' << spec.script;
            return key.str();
        }
    }  // namespace detail

    std::string content_hash(const figure_spec& spec) {
        return detail::to_hex(std::hash<std::string>{}(detail::make_content_key(spec)));
    }

    std::string script_hash(std::string_view script) {
        return detail::to_hex(std::hash<std::string_view>{}(script));
    }

    fs::path figure_path(const figure_spec& spec) {
        auto stem = content_hash(spec);
        return (spec.directory / "{}.{}"_format(stem, extension(spec.format))).lexically_normal();
    }

    fs::path transcript_path(const fs::path& figure_path) {
        auto path = figure_path;
        path.replace_extension(transcript_extension);
        return path.lexically_normal();
    }

}  // namespace plotgate
