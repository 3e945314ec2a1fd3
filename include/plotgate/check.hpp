#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace plotgate {

    /**
     * Outcome of one static script check. Results form a monoid under combine():
     * passed() is the identity, failures absorb passes, and two failures concatenate
     * their messages left-to-right separated by a newline.
     */
    struct check_result {
        std::optional<std::string> failure{};

        static check_result passed() { return {}; }
        static check_result failed(std::string message) { return {std::move(message)}; }

        bool ok() const { return !failure.has_value(); }

        bool operator==(const check_result&) const = default;
    };

    check_result combine(const check_result& lhs, const check_result& rhs);

    // Whole-text inspection only; checks must not touch the file system or network
    using script_check = std::function<check_result(std::string_view script)>;

    // Runs every check unconditionally and left-folds the results
    check_result fold_checks(std::span<const script_check> checks, std::string_view script);

    // Fails with `message` when `pattern` (ECMAScript regex) matches anywhere in the script
    script_check forbid_pattern(std::string pattern, std::string message);

}  // namespace plotgate
