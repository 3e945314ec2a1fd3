#pragma once

#include "config.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace plotgate {

    struct script_success {
        bool operator==(const script_success&) const = default;
    };

    // a static check rejected the script; nothing was spawned
    struct script_checks_failed {
        std::string message{};
        bool operator==(const script_checks_failed&) const = default;
    };

    // the process exited non-zero and the toolkit probe reported it available
    struct script_failure {
        std::string command{};
        int exit_code{};
        bool operator==(const script_failure&) const = default;
    };

    // the process exited non-zero and the toolkit probe reported it missing
    struct toolkit_not_installed {
        toolkit kit{toolkit::matplotlib};
        bool operator==(const toolkit_not_installed&) const = default;
    };

    using script_result = std::variant<script_success, script_checks_failed, script_failure, toolkit_not_installed>;

    enum class script_result_kind : uint8_t { success, checks_failed, failure, toolkit_not_installed };

    inline constexpr std::string_view to_string(script_result_kind kind) {
        switch (kind) {
            case script_result_kind::success:
                return "success"sv;
            case script_result_kind::checks_failed:
                return "checks_failed"sv;
            case script_result_kind::failure:
                return "failure"sv;
            case script_result_kind::toolkit_not_installed:
                return "toolkit_not_installed"sv;
        }
        return "failure"sv;
    }

    inline script_result_kind kind_of(const script_result& result) {
        return std::visit(
                [](const auto& r) {
                    using T = std::decay_t<decltype(r)>;
                    if constexpr (std::is_same_v<T, script_success>) {
                        return script_result_kind::success;
                    }
                    else if constexpr (std::is_same_v<T, script_checks_failed>) {
                        return script_result_kind::checks_failed;
                    }
                    else if constexpr (std::is_same_v<T, script_failure>) {
                        return script_result_kind::failure;
                    }
                    else {
                        static_assert(std::is_same_v<T, toolkit_not_installed>);
                        return script_result_kind::toolkit_not_installed;
                    }
                },
                result);
    }

    inline bool succeeded(const script_result& result) {
        return std::holds_alternative<script_success>(result);
    }

    // One-line human readable description, used by logs and the table report
    std::string describe(const script_result& result);

}  // namespace plotgate
