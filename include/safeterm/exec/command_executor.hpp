#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "safeterm/sandbox/path_sandbox.hpp"
#include "safeterm/sandbox/reversible_deleter.hpp"
#include "safeterm/sandbox/sandbox_config.hpp"

namespace safeterm::exec {

/// Substrings (lower-case) that mark an argument as potentially dangerous.
inline constexpr std::array<std::string_view, 5> kDangerousPatterns = {
    "../", "~/", "/etc/", "/sys/", "/proc/",
};

/// Returns the first denylisted pattern contained in `arg`, compared
/// case-insensitively, or nullopt.
auto find_dangerous_pattern(std::string_view arg) -> std::optional<std::string_view>;

/// Entry point that command handlers use to reach the sandbox.
///
/// Bundles the argument gate, the path resolver and the recycle-bin
/// deleter around one SandboxConfig. The gate only inspects argument
/// shape; PathSandbox::resolve remains the authority on which paths are
/// allowed and must be called whether or not the gate passed.
class CommandExecutor {
public:
    explicit CommandExecutor(sandbox::SandboxConfig& config);

    CommandExecutor(const CommandExecutor&) = delete;
    CommandExecutor& operator=(const CommandExecutor&) = delete;

    /// Logs a warning for every argument containing a denylisted pattern.
    /// Returns false if one was found and safe mode is on; otherwise true.
    [[nodiscard]] auto validate_args(const std::vector<std::string>& args) const -> bool;

    [[nodiscard]] auto sandbox() noexcept -> sandbox::PathSandbox& { return sandbox_; }
    [[nodiscard]] auto sandbox() const noexcept -> const sandbox::PathSandbox& { return sandbox_; }
    [[nodiscard]] auto deleter() noexcept -> sandbox::ReversibleDeleter& { return deleter_; }
    [[nodiscard]] auto config() const noexcept -> const sandbox::SandboxConfig& { return config_; }

    [[nodiscard]] auto dry_run() const noexcept -> bool { return config_.dry_run(); }
    void set_dry_run(bool enabled) noexcept { config_.set_dry_run(enabled); }
    [[nodiscard]] auto safe_mode() const noexcept -> bool { return config_.safe_mode(); }

private:
    sandbox::SandboxConfig& config_;
    sandbox::PathSandbox sandbox_;
    sandbox::ReversibleDeleter deleter_;
};

} // namespace safeterm::exec
