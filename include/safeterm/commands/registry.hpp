#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "safeterm/commands/command.hpp"
#include "safeterm/core/error.hpp"

namespace safeterm::commands {

/// Registry that holds all commands the shell can dispatch to.
///
/// Commands are registered by name once at startup and looked up by the
/// first word of each input line. The registry owns all registered
/// command instances.
class CommandRegistry {
public:
    CommandRegistry() = default;
    ~CommandRegistry() = default;

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;
    CommandRegistry(CommandRegistry&&) = default;
    CommandRegistry& operator=(CommandRegistry&&) = default;

    /// Register a command. The registry takes ownership. If a command with
    /// the same name already exists, it will be replaced.
    void register_command(std::unique_ptr<Command> command);

    /// Look up a command by name. Returns nullptr if not found.
    [[nodiscard]] auto get(std::string_view name) -> Command*;
    [[nodiscard]] auto get(std::string_view name) const -> const Command*;

    /// Registered names in lexicographic order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    /// Execute a command by name. Fails with ErrorCode::NotFound if no
    /// such command is registered.
    auto execute(std::string_view name, CommandContext& ctx,
                 const std::vector<std::string>& args) -> Result<Outcome>;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /// Remove a command by name. Returns true if it was found and removed.
    auto remove(std::string_view name) -> bool;

private:
    std::map<std::string, std::unique_ptr<Command>, std::less<>> commands_;
};

/// Registers pwd, ls, cd, mkdir, rm, help, exit and quit.
void register_builtin_commands(CommandRegistry& registry);

} // namespace safeterm::commands
