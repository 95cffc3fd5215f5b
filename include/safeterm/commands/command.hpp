#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "safeterm/core/error.hpp"
#include "safeterm/exec/command_executor.hpp"

namespace safeterm::commands {

/// Result of running one command.
enum class Outcome {
    Success,
    Failure,
    Exit,  // the shell should stop reading input
};

/// Everything a handler may touch while it runs. Handlers never reach the
/// filesystem except through `executor`.
struct CommandContext {
    exec::CommandExecutor& executor;
    std::ostream& out;
    std::ostream& err;
    std::istream& in;
    bool colors_enabled = true;
};

/// A built-in shell command.
class Command {
public:
    virtual ~Command() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// One line: "<usage> - <description>".
    [[nodiscard]] virtual auto help() const -> std::string = 0;

    /// Run with the words following the command name. Ordinary failures
    /// are reported on ctx.err and returned as Outcome::Failure.
    virtual auto execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome = 0;
};

enum class Color {
    Red,
    Green,
    Yellow,
    Blue,
    Cyan,
    Dim,
};

/// Wraps `text` in ANSI color codes when `enabled`.
auto colorize(std::string_view text, Color color, bool enabled) -> std::string;

/// Prints `error` on ctx.err and logs it with its code name.
void report(CommandContext& ctx, const Error& error);

/// True if any argument is `long_flag`, or a short-option cluster such as
/// `-rf` that contains `short_flag`.
auto has_flag(const std::vector<std::string>& args, char short_flag,
              std::string_view long_flag) -> bool;

/// Arguments that are not options (do not start with '-').
auto operands(const std::vector<std::string>& args) -> std::vector<std::string>;

} // namespace safeterm::commands
