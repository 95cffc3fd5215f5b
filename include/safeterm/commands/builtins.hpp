#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "safeterm/commands/command.hpp"
#include "safeterm/commands/registry.hpp"

namespace safeterm::commands {

/// Print the working directory.
class PwdCommand : public Command {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "pwd"; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;
};

/// List directory contents. Directories sort first, then names
/// case-insensitively; dot-entries are hidden unless -a.
class LsCommand : public Command {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "ls"; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;
};

/// Change the sandbox working directory. No argument returns to the root.
class CdCommand : public Command {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "cd"; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;
};

class MkdirCommand : public Command {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "mkdir"; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;
};

/// Remove files and directories by moving them into the recycle bin.
/// A recursive directory removal without -f asks for confirmation on
/// ctx.in.
class RmCommand : public Command {
public:
    [[nodiscard]] auto name() const -> std::string_view override { return "rm"; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;
};

class HelpCommand : public Command {
public:
    explicit HelpCommand(const CommandRegistry& registry) : registry_(registry) {}

    [[nodiscard]] auto name() const -> std::string_view override { return "help"; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;

private:
    const CommandRegistry& registry_;
};

/// `exit` and its `quit` alias.
class ExitCommand : public Command {
public:
    explicit ExitCommand(std::string name = "exit") : name_(std::move(name)) {}

    [[nodiscard]] auto name() const -> std::string_view override { return name_; }
    [[nodiscard]] auto help() const -> std::string override;
    auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome override;

private:
    std::string name_;
};

/// Human-readable size: 512 -> "512B", 1536 -> "1.5K", 2048 -> "2K".
auto format_size(std::uintmax_t bytes) -> std::string;

/// `ls -l` style mode string, e.g. "drwxr-xr-x".
auto format_mode(unsigned int st_mode) -> std::string;

} // namespace safeterm::commands
