#include "safeterm/cli/app.hpp"
#include "safeterm/cli/commands.hpp"
#include "safeterm/core/logger.hpp"

#include <filesystem>
#include <iostream>

// Version string; typically injected by CMake via -DSAFETERM_VERSION_STRING=...
#ifndef SAFETERM_VERSION_STRING
#define SAFETERM_VERSION_STRING "0.1.0-dev"
#endif

namespace safeterm::cli {

App::App()
    : cli_("safeterm", "Sandboxed file-management shell")
{
    cli_.set_version_flag("--version", SAFETERM_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("SAFETERM_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--root", options_.root,
                    "Directory the shell is confined to")
        ->envname("SAFETERM_ROOT");

    cli_.add_flag("--dry-run", options_.dry_run,
                  "Report mutating operations without performing them");

    cli_.add_flag("--no-safe-mode", options_.no_safe_mode,
                  "Only warn about dangerous arguments instead of rejecting them");

    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("SAFETERM_LOG_LEVEL");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    resolve_config();

    if (version_cmd_->parsed()) {
        return print_version();
    }
    if (config_cmd_->parsed()) {
        return show_config(config_, validate_only_);
    }
    if (run_cmd_->parsed()) {
        return run_once(config_, run_cmd_->remaining());
    }
    if (shell_cmd_->parsed()) {
        return run_shell(config_);
    }

    LOG_ERROR("No subcommand selected");
    return 1;
}

void App::resolve_config() {
    // Logging is needed before the config file is read so load warnings
    // are visible; the level is reapplied once the config is known.
    Logger::init("safeterm", options_.log_level.empty() ? "info" : options_.log_level);

    if (!options_.config_path.empty()) {
        LOG_DEBUG("Loading configuration from: {}", options_.config_path);
        config_ = load_config(std::filesystem::path(options_.config_path));
    } else {
        config_ = default_config();
    }

    apply_env_overrides(config_);

    if (!options_.root.empty()) {
        config_.allowed_root = options_.root;
    }
    if (options_.dry_run) {
        config_.dry_run = true;
    }
    if (options_.no_safe_mode) {
        config_.safe_mode = false;
    }
    if (!options_.log_level.empty()) {
        config_.log_level = options_.log_level;
    }

    Logger::set_level(config_.log_level);
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() -> Config& {
    return config_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    shell_cmd_ = register_shell_command(cli_);
    run_cmd_ = register_run_command(cli_);
    config_cmd_ = register_config_command(cli_, validate_only_);
    version_cmd_ = register_version_command(cli_);
}

} // namespace safeterm::cli
