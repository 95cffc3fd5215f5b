#include "safeterm/commands/builtins.hpp"

#include <memory>

namespace safeterm::commands {

void register_builtin_commands(CommandRegistry& registry) {
    registry.register_command(std::make_unique<PwdCommand>());
    registry.register_command(std::make_unique<LsCommand>());
    registry.register_command(std::make_unique<CdCommand>());
    registry.register_command(std::make_unique<MkdirCommand>());
    registry.register_command(std::make_unique<RmCommand>());
    registry.register_command(std::make_unique<ExitCommand>("exit"));
    registry.register_command(std::make_unique<ExitCommand>("quit"));
    // help lists whatever is registered at the time it runs
    registry.register_command(std::make_unique<HelpCommand>(registry));
}

} // namespace safeterm::commands
