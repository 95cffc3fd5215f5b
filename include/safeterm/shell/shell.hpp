#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "safeterm/commands/command.hpp"
#include "safeterm/commands/registry.hpp"
#include "safeterm/exec/command_executor.hpp"

namespace safeterm::shell {

struct ShellOptions {
    bool colors_enabled = true;
    std::string prompt = "> ";
};

/// Interactive read-eval loop over the command registry.
///
/// Each line is split into words, aliases are expanded, the argument gate
/// runs, and then the named command is dispatched. A failing command never
/// ends the loop; only EOF or an Exit outcome does.
class Shell {
public:
    Shell(exec::CommandExecutor& executor,
          commands::CommandRegistry& registry,
          std::ostream& out,
          std::ostream& err,
          std::istream& in,
          ShellOptions options = {});

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    /// Read lines from the input stream until EOF or exit.
    /// @returns Process exit code.
    auto run() -> int;

    /// Parse and run one input line. Blank lines succeed without output.
    auto execute_line(std::string_view line) -> commands::Outcome;

    /// Run one already-split command. `words[0]` is the command name.
    auto execute(std::vector<std::string> words) -> commands::Outcome;

    /// Working directory relative to the root ("/" at the root), truncated
    /// to 40 characters, followed by the configured prompt string.
    [[nodiscard]] auto prompt() const -> std::string;

private:
    auto context() -> commands::CommandContext;

    exec::CommandExecutor& executor_;
    commands::CommandRegistry& registry_;
    std::ostream& out_;
    std::ostream& err_;
    std::istream& in_;
    ShellOptions options_;
};

/// Expands the `ll` and `la` aliases in place. Returns true if an alias
/// was applied.
auto expand_alias(std::vector<std::string>& words) -> bool;

} // namespace safeterm::shell
