#include "plotgate/report.hpp"

#include "plotgate/format.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>

namespace glz {

    template <>
    struct meta<plotgate::result_record> {
        using T = plotgate::result_record;
        static constexpr auto value = object(
                "schema_version",
                &T::schema_version,
                "result",
                &T::result,
                "toolkit",
                &T::toolkit,
                "figure_path",
                &T::figure_path,
                "transcript_path",
                &T::transcript_path,
                "script_path",
                &T::script_path,
                "message",
                &T::message,
                "command",
                &T::command,
                "exit_code",
                &T::exit_code);
    };

}  // namespace glz

namespace plotgate {

    result_record make_result_record(
            const execution_context& ctx, const figure_spec& spec, const script_result& result) {
        auto figure = figure_path(spec);

        result_record record{};
        record.result = std::string{to_string(kind_of(result))};
        record.toolkit = std::string{to_string(spec.kit)};
        record.figure_path = figure.string();
        record.transcript_path = transcript_path(figure).string();
        record.script_path = script_path(ctx, spec).string();

        if (const auto* checks = std::get_if<script_checks_failed>(&result)) {
            record.message = checks->message;
        }
        else if (const auto* failed = std::get_if<script_failure>(&result)) {
            record.command = failed->command;
            record.exit_code = failed->exit_code;
        }
        if (!succeeded(result) && !record.message) {
            record.message = describe(result);
        }
        return record;
    }

    std::string to_json(const result_record& record) {
        std::string json{};
        auto ec = glz::write_json(record, json);
        if (ec) {
            throw std::runtime_error("failed to serialize result record");
        }
        return json;
    }

    std::optional<result_record> parse_result_record(std::string_view json) {
        result_record record{};
        std::string buffer{json};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(record, buffer);
        if (ec) {
            return std::nullopt;
        }
        return record;
    }

}  // namespace plotgate
