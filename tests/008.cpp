#include "utils.hpp"

#include "cli.hpp"

#include <vector>

namespace plotgate::test {
    using namespace std::string_view_literals;

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }

        std::optional<int> parse(std::vector<std::string> args, cli::invocation& inv) {
            auto argv = to_argv(args);
            return cli::parse_cli(static_cast<int>(argv.size()), argv.data(), inv);
        }
    }  // namespace detail

    TEST_CASE("008: parse_cli accepts render options", "[008][cli]") {
        detail::temp_dir temp{"plotgate_008_valid"};
        auto script = temp.path / "plot.gp";
        detail::write_file(script, "plot sin(x)\n");

        cli::invocation inv{};
        auto result = detail::parse(
                {"plotgate",
                 script.string(),
                 "--toolkit",
                 "GNUPLOT",
                 "--format",
                 "jpeg",
                 "--directory",
                 (temp.path / "figures").string(),
                 "--dpi",
                 "150",
                 "--attr",
                 "transparent = true",
                 "--exe",
                 "gnuplot=/opt/gnuplot/bin/gnuplot",
                 "--temp-dir",
                 (temp.path / "scripts").string(),
                 "--output",
                 "json",
                 "--log-level",
                 "debug",
                 "--color",
                 "always"},
                inv);

        CHECK(!result);
        CHECK(inv.spec.kit == toolkit::gnuplot);
        CHECK(inv.spec.format == save_format::jpg);
        CHECK(inv.spec.dpi == 150);
        CHECK(inv.spec.script == "plot sin(x)\n");
        CHECK(inv.spec.directory == temp.path / "figures");
        REQUIRE(inv.spec.extra_attrs.contains("transparent"));
        CHECK(inv.spec.extra_attrs.at("transparent") == "true");
        REQUIRE(inv.cfg.executables.contains(toolkit::gnuplot));
        CHECK(inv.cfg.executables.at(toolkit::gnuplot) == "/opt/gnuplot/bin/gnuplot");
        REQUIRE(inv.cfg.temp_dir);
        CHECK(*inv.cfg.temp_dir == temp.path / "scripts");
        CHECK(inv.cfg.output == output_mode::json);
        CHECK(inv.cfg.level == log_level::debug);
        CHECK(inv.cfg.color == color_mode::always);
        CHECK_FALSE(inv.cfg.print_paths);
    }

    TEST_CASE("008: parse_cli defaults", "[008][cli]") {
        detail::temp_dir temp{"plotgate_008_defaults"};
        auto script = temp.path / "plot.py";
        detail::write_file(script, "plt.plot([1, 2])\n");

        cli::invocation inv{};
        auto result = detail::parse({"plotgate", script.string(), "--no-color"}, inv);

        CHECK(!result);
        CHECK(inv.spec.kit == toolkit::matplotlib);
        CHECK(inv.spec.format == save_format::png);
        CHECK(inv.spec.dpi == default_dpi);
        CHECK(inv.spec.directory == "plots");
        CHECK_FALSE(inv.cfg.temp_dir);
        CHECK(inv.cfg.output == output_mode::table);
        CHECK(inv.cfg.color == color_mode::never);
    }

    TEST_CASE("008: parse_cli rejects usage errors with exit code 2", "[008][cli]") {
        detail::temp_dir temp{"plotgate_008_usage"};
        auto script = temp.path / "plot.py";
        detail::write_file(script, "plt.plot([1, 2])\n");
        auto path = script.string();

        SECTION("unknown toolkit") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--toolkit", "excel"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("unknown format") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--format", "bmp"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("attribute without a value") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--attr", "transparent"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("executable override for an unknown toolkit") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--exe", "excel=/usr/bin/excel"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("unknown color mode") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--color", "sometimes"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("non-positive dpi fails option validation") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--dpi", "0"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("unknown flag") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", path, "--frobnicate"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("missing script argument") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", "--toolkit", "gnuplot"}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("unreadable script file") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", (temp.path / "absent.py").string()}, inv);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("008: parse_cli handles one-shot exits", "[008][cli]") {
        SECTION("version") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", "--version"}, inv);
            REQUIRE(result);
            CHECK(*result == 0);
        }

        SECTION("help") {
            cli::invocation inv{};
            auto result = detail::parse({"plotgate", "--help"}, inv);
            REQUIRE(result);
            CHECK(*result == 0);
        }
    }

    TEST_CASE("008: exit codes follow the result kind", "[008][cli]") {
        CHECK(cli::exit_code_for(script_success{}) == 0);
        CHECK(cli::exit_code_for(script_checks_failed{"plt.show"}) == 3);
        CHECK(cli::exit_code_for(script_failure{"gnuplot -c a.gp", 1}) == 4);
        CHECK(cli::exit_code_for(toolkit_not_installed{toolkit::gnuplot}) == 5);
    }

    TEST_CASE("008: color follows mode and terminal", "[008][cli]") {
        CHECK(cli::should_colorize(color_mode::always, false));
        CHECK_FALSE(cli::should_colorize(color_mode::never, true));
        CHECK(cli::should_colorize(color_mode::automatic, true));
        CHECK_FALSE(cli::should_colorize(color_mode::automatic, false));
    }
}  // namespace plotgate::test
