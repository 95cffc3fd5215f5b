#include "safeterm/commands/builtins.hpp"

namespace safeterm::commands {

auto PwdCommand::help() const -> std::string {
    return "pwd - Print the current working directory";
}

auto PwdCommand::execute(CommandContext& ctx, const std::vector<std::string>& /*args*/) -> Outcome {
    ctx.out << ctx.executor.sandbox().working_directory().string() << "\n";
    return Outcome::Success;
}

} // namespace safeterm::commands
