/**
 * @file main.cpp
 * @brief verso CLI entry point
 *
 * Computes the version of the repository enclosing the working directory and
 * prints the variables as JSON, or a single variable with --show-variable.
 *
 * Exit codes: 0 success, 1 computation error, 2 usage error.
 */

#include "verso/require_cpp23.hpp"

#include "verso/calculator.hpp"
#include "verso/common.hpp"
#include "verso/config.hpp"
#include "verso/log.hpp"
#include "verso/variables.hpp"
#include "verso/version.hpp"

#include <charconv>
#include <cstdio>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_version()
{
    std::println("verso {} ({})", verso::kVersion, verso::kBuildId);
    std::println("  cache format: {}", verso::kCacheFormatVersion);
}

void print_help()
{
    std::print(R"(verso - semantic version calculator for git repositories

Usage: verso [options]

Options:
  --cwd DIR                   Directory inside the repository (default: current)
  --config FILE               Configuration file (default: <root>/verso.yml)
  --override-config KEY=VALUE Override a setting for this run; bypasses the cache
                              (tag-prefix, next-version, increment, tag, mode, ...)
  --no-cache                  Do not read or write the version cache
  --no-normalize              Do not normalize the target branch name
  --target-url URL            Remote URL identifying the repository
  --target-branch NAME        Branch to version when HEAD is detached
  --timeout SECONDS           Deadline for git commands
  --show-variable NAME        Print one variable (e.g. FullSemVer)
  --verbose                   Log diagnostics to stderr
  --help, -h                  Show this help message
  --version, -v               Show version information

Exit codes:
  0  success
  1  computation error
  2  usage error
)");
}

struct CliOptions
{
    std::filesystem::path cwd;
    std::optional<std::filesystem::path> config_file;
    std::vector<std::string> overrides;
    bool no_cache;
    bool no_normalize;
    std::optional<std::string> target_url;
    std::optional<std::string> target_branch;
    std::optional<int> timeout_seconds;
    std::optional<std::string> show_variable;
    bool verbose;
    bool show_help;
    bool show_version;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> verso::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            verso::Error::make("MissingArgument",
                               std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] verso::Result<int> parse_timeout_value(std::string_view value)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed <= 0) {
        return std::unexpected(
            verso::Error::make("InvalidArgument",
                               std::string("Invalid --timeout value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] auto set_value_option(std::string_view arg,
                                    // CLI parsing signature is stable.
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    CliOptions& options,
                                    bool& skip_next) -> verso::Result<bool>
{
    const bool takes_value = arg == "--cwd" || arg == "--config" || arg == "--override-config"
                             || arg == "--target-url" || arg == "--target-branch" || arg == "--timeout"
                             || arg == "--show-variable";
    if (!takes_value) {
        return verso::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;

    if (arg == "--cwd") {
        options.cwd = *value;
    } else if (arg == "--config") {
        options.config_file = *value;
    } else if (arg == "--override-config") {
        options.overrides.push_back(*value);
    } else if (arg == "--target-url") {
        options.target_url = *value;
    } else if (arg == "--target-branch") {
        options.target_branch = *value;
    } else if (arg == "--timeout") {
        auto parsed = parse_timeout_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.timeout_seconds = *parsed;
    } else {
        options.show_variable = *value;
    }
    return verso::Result<bool>{true};
}

[[nodiscard]] verso::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options{.cwd = std::filesystem::path{},
                       .config_file = std::nullopt,
                       .overrides = {},
                       .no_cache = false,
                       .no_normalize = false,
                       .target_url = std::nullopt,
                       .target_branch = std::nullopt,
                       .timeout_seconds = std::nullopt,
                       .show_variable = std::nullopt,
                       .verbose = false,
                       .show_help = false,
                       .show_version = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (i == 0 || arg_ptr == nullptr) {
            continue;
        }
        if (skip_next) {
            skip_next = false;
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            options.show_version = true;
            continue;
        }
        if (arg == "--no-cache") {
            options.no_cache = true;
            continue;
        }
        if (arg == "--no-normalize") {
            options.no_normalize = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        auto handled = set_value_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                verso::Error::make("UnknownOption", "Unknown option: " + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] verso::Result<verso::calculator::ComputeOptions> to_compute_options(const CliOptions& cli)
{
    verso::calculator::ComputeOptions options;
    std::error_code ec;
    options.working_directory = cli.cwd.empty() ? std::filesystem::current_path(ec) : cli.cwd;
    if (ec) {
        return std::unexpected(
            verso::Error::make("IOError", "Failed to read the current directory: " + ec.message()));
    }
    options.config_file = cli.config_file;
    options.no_cache = cli.no_cache;
    options.no_normalize = cli.no_normalize;
    options.repository_info = verso::cache::RepositoryInfo{.target_url = cli.target_url,
                                                           .target_branch = cli.target_branch};
    if (cli.timeout_seconds) {
        options.deadline = std::chrono::steady_clock::now() + std::chrono::seconds(*cli.timeout_seconds);
    }

    if (!cli.overrides.empty()) {
        verso::config::ConfigDocument document;
        for (const auto& assignment : cli.overrides) {
            if (auto applied = verso::config::apply_override(document, assignment); !applied) {
                return std::unexpected(applied.error());
            }
        }
        options.override_config = std::move(document);
    }

    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    options.logger = verso::log::make_logger(verso::log::kLoggerName,
                                             {sink},
                                             cli.verbose ? spdlog::level::debug : spdlog::level::warn);
    return options;
}

int run(const CliOptions& cli)
{
    auto options = to_compute_options(cli);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitUsage;
    }

    auto variables = verso::calculator::compute_version(*options);
    if (!variables) {
        std::println(stderr, "Error [{}]: {}", variables.error().code, variables.error().message);
        return kExitFailure;
    }

    if (cli.show_variable) {
        auto value = verso::version::find_variable(*variables, *cli.show_variable);
        if (!value) {
            std::println(stderr, "Error: unknown variable '{}'", *cli.show_variable);
            return kExitUsage;
        }
        std::println("{}", *value);
        return kExitSuccess;
    }

    std::println("{}", verso::version::variables_to_json(*variables).dump(2));
    return kExitSuccess;
}

}  // namespace

int main(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto cli = parse_args(args);
    if (!cli) {
        std::println(stderr, "Error: {}", cli.error().message);
        print_help();
        return kExitUsage;
    }
    if (cli->show_help) {
        print_help();
        return kExitSuccess;
    }
    if (cli->show_version) {
        print_version();
        return kExitSuccess;
    }
    return run(*cli);
}
