#include "plotgate/check.hpp"

#include <memory>
#include <regex>

namespace plotgate {

    check_result combine(const check_result& lhs, const check_result& rhs) {
        if (lhs.ok()) {
            return rhs;
        }
        if (rhs.ok()) {
            return lhs;
        }
        return check_result::failed(*lhs.failure + '\n' + *rhs.failure);
    }

    check_result fold_checks(std::span<const script_check> checks, std::string_view script) {
        auto result = check_result::passed();
        for (const auto& check : checks) {
            result = combine(result, check(script));
        }
        return result;
    }

    script_check forbid_pattern(std::string pattern, std::string message) {
        auto compiled = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
        return [compiled, message = std::move(message)](std::string_view script) {
            if (std::regex_search(script.begin(), script.end(), *compiled)) {
                return check_result::failed(message);
            }
            return check_result::passed();
        };
    }

}  // namespace plotgate
