#pragma once

#include "runner.hpp"

#include <optional>
#include <string>

namespace plotgate {

    // Flat, serializable view of one pipeline run
    struct result_record {
        int schema_version{1};
        std::string result{};
        std::string toolkit{};
        std::string figure_path{};
        std::string transcript_path{};
        std::string script_path{};
        std::optional<std::string> message{};
        std::optional<std::string> command{};
        std::optional<int> exit_code{};
    };

    result_record make_result_record(const execution_context& ctx, const figure_spec& spec, const script_result& result);

    // Throws std::runtime_error when serialization fails
    std::string to_json(const result_record& record);

    std::optional<result_record> parse_result_record(std::string_view json);

}  // namespace plotgate
