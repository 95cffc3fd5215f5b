#include "safeterm/commands/builtins.hpp"

#include <algorithm>

namespace safeterm::commands {

auto HelpCommand::help() const -> std::string {
    return "help [command] - Show help for commands";
}

auto HelpCommand::execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome {
    if (!args.empty()) {
        const auto* command = registry_.get(args[0]);
        if (!command) {
            ctx.err << colorize("Unknown command: " + args[0], Color::Red, ctx.colors_enabled) << "\n";
            return Outcome::Failure;
        }
        ctx.out << command->help() << "\n";
        return Outcome::Success;
    }

    auto names = registry_.names();
    std::size_t width = 0;
    for (const auto& name : names) {
        width = std::max(width, name.size());
    }

    ctx.out << "Available commands:\n";
    for (const auto& name : names) {
        auto text = registry_.get(name)->help();
        auto sep = text.find(" - ");
        auto description = sep == std::string::npos ? text : text.substr(sep + 3);
        ctx.out << "  " << colorize(name, Color::Cyan, ctx.colors_enabled)
                << std::string(width - name.size() + 2, ' ') << description << "\n";
    }
    ctx.out << "\nUse 'help <command>' for detailed help on a specific command.\n";
    return Outcome::Success;
}

} // namespace safeterm::commands
