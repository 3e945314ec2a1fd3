#pragma once

#include <string_view>

#ifndef PLOTGATE_SHELL_PATH
#define PLOTGATE_SHELL_PATH "/bin/sh"
#endif

namespace plotgate::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr auto shell_path = std::string_view{PLOTGATE_SHELL_PATH};
    inline constexpr auto shell_argv0 = "sh"sv;
    inline constexpr auto shell_command_flag = "-c"sv;

}  // namespace plotgate::internal::platform
