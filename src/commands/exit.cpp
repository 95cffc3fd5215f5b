#include "safeterm/commands/builtins.hpp"

namespace safeterm::commands {

auto ExitCommand::help() const -> std::string {
    return name_ + " - Exit the terminal";
}

auto ExitCommand::execute(CommandContext& ctx, const std::vector<std::string>& /*args*/) -> Outcome {
    ctx.out << "Goodbye!\n";
    return Outcome::Exit;
}

} // namespace safeterm::commands
