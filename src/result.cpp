#include "plotgate/result.hpp"

#include "plotgate/format.hpp"

using namespace plotgate::literals;

namespace plotgate {

    std::string describe(const script_result& result) {
        return std::visit(
                [](const auto& r) -> std::string {
                    using T = std::decay_t<decltype(r)>;
                    if constexpr (std::is_same_v<T, script_success>) {
                        return "success";
                    }
                    else if constexpr (std::is_same_v<T, script_checks_failed>) {
                        return "script did not pass checks: {}"_format(r.message);
                    }
                    else if constexpr (std::is_same_v<T, script_failure>) {
                        return "command \"{}\" failed with exit code {}"_format(r.command, r.exit_code);
                    }
                    else {
                        return "toolkit {} is not installed"_format(r.kit);
                    }
                },
                result);
    }

}  // namespace plotgate
