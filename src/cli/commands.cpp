#include "safeterm/cli/commands.hpp"
#include "safeterm/commands/builtins.hpp"
#include "safeterm/commands/registry.hpp"
#include "safeterm/core/logger.hpp"
#include "safeterm/exec/command_executor.hpp"
#include "safeterm/sandbox/sandbox_config.hpp"
#include "safeterm/shell/shell.hpp"

#include <filesystem>
#include <iostream>

#include <unistd.h>

#include <nlohmann/json.hpp>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef SAFETERM_VERSION_STRING
#define SAFETERM_VERSION_STRING "0.1.0-dev"
#endif

namespace safeterm::cli {

using json = nlohmann::json;

namespace {

auto shell_options(const Config& config) -> shell::ShellOptions {
    shell::ShellOptions options;
    options.colors_enabled = config.colors_enabled && ::isatty(STDOUT_FILENO) == 1;
    options.prompt = config.prompt;
    return options;
}

/// Runs `body` with a fully wired executor, registry and shell. Returns 1
/// if the sandbox cannot be set up.
template <typename Body>
auto with_shell(const Config& config, Body&& body) -> int {
    auto sandbox_config = sandbox::SandboxConfig::create(config);
    if (!sandbox_config) {
        LOG_ERROR("Sandbox setup failed: {}", sandbox_config.error().what());
        std::cerr << "safeterm: " << sandbox_config.error().what() << "\n";
        return 1;
    }

    exec::CommandExecutor executor(**sandbox_config);
    commands::CommandRegistry registry;
    commands::register_builtin_commands(registry);

    auto options = shell_options(config);
    if (executor.dry_run()) {
        std::cout << commands::colorize("DRY RUN MODE: No changes will be made",
                                        commands::Color::Yellow, options.colors_enabled) << "\n";
    }

    shell::Shell session(executor, registry, std::cout, std::cerr, std::cin, std::move(options));
    int rc = body(session);
    Logger::flush();
    return rc;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// shell command
// ---------------------------------------------------------------------------

auto register_shell_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("shell", "Start the interactive sandboxed shell");
}

auto run_shell(const Config& config) -> int {
    LOG_INFO("Starting shell with root {}", config.allowed_root);
    return with_shell(config, [](shell::Shell& session) { return session.run(); });
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

auto register_run_command(CLI::App& app) -> CLI::App* {
    auto* sub = app.add_subcommand("run", "Execute a single command and exit");
    // Everything after `run` belongs to the shell command, options included.
    sub->prefix_command();
    return sub;
}

auto run_once(const Config& config, const std::vector<std::string>& words) -> int {
    if (words.empty()) {
        std::cerr << "safeterm: run requires a command\n";
        return 1;
    }
    return with_shell(config, [&words](shell::Shell& session) {
        auto outcome = session.execute(words);
        return outcome == commands::Outcome::Failure ? 1 : 0;
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app, bool& validate_only) -> CLI::App* {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");
    sub->add_flag("--validate", validate_only,
                  "Validate configuration without printing");
    return sub;
}

auto show_config(const Config& config, bool validate_only) -> int {
    if (validate_only) {
        auto valid = sandbox::SandboxConfig::validate(config);
        if (!valid) {
            LOG_ERROR("[{}] {}", error_code_to_string(valid.error().code()), valid.error().what());
            std::cerr << "Configuration is invalid: " << valid.error().what() << "\n";
            return 1;
        }
        std::cout << "Configuration is valid.\n";
        return 0;
    }

    json j = config;
    std::cout << j.dump(2) << "\n";
    return 0;
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("version", "Print version information");
}

auto print_version() -> int {
    std::cout << "safeterm " << SAFETERM_VERSION_STRING << "\n";
    std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
    std::cout << "Compiler: clang " << __clang_major__ << "."
              << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
    std::cout << "Compiler: gcc " << __GNUC__ << "."
              << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
    std::cout << "Compiler: unknown\n";
#endif
    return 0;
}

} // namespace safeterm::cli
