#pragma once

#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "safeterm/core/config.hpp"

namespace safeterm::cli {

/// Values of the global command-line options. Empty strings and false
/// flags mean "not given" and leave the loaded configuration alone.
struct GlobalOptions {
    std::string config_path;
    std::string root;
    std::string log_level;
    bool dry_run = false;
    bool no_safe_mode = false;
};

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, builds the effective
/// configuration (file, then environment, then flags) and dispatches to
/// the selected subcommand (shell, run, config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// Access the effective configuration. Populated by run().
    [[nodiscard]] auto config() -> Config&;
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// Merge the config file, environment and global flags into config_.
    void resolve_config();

    CLI::App cli_;
    Config config_;
    GlobalOptions options_;
    bool validate_only_ = false;

    CLI::App* shell_cmd_ = nullptr;
    CLI::App* run_cmd_ = nullptr;
    CLI::App* config_cmd_ = nullptr;
    CLI::App* version_cmd_ = nullptr;
};

} // namespace safeterm::cli
