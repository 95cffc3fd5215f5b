#include "safeterm/commands/registry.hpp"

#include "safeterm/core/logger.hpp"

namespace safeterm::commands {

void CommandRegistry::register_command(std::unique_ptr<Command> command) {
    if (!command) {
        LOG_WARN("Attempted to register a null command");
        return;
    }

    std::string name(command->name());

    if (commands_.contains(name)) {
        LOG_WARN("Replacing existing command: {}", name);
    } else {
        LOG_DEBUG("Registered command: {}", name);
    }

    commands_[std::move(name)] = std::move(command);
}

auto CommandRegistry::get(std::string_view name) -> Command* {
    auto it = commands_.find(name);
    if (it != commands_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto CommandRegistry::get(std::string_view name) const -> const Command* {
    auto it = commands_.find(name);
    if (it != commands_.end()) {
        return it->second.get();
    }
    return nullptr;
}

auto CommandRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(commands_.size());
    for (const auto& [name, command] : commands_) {
        result.push_back(name);
    }
    return result;
}

auto CommandRegistry::execute(std::string_view name, CommandContext& ctx,
                              const std::vector<std::string>& args) -> Result<Outcome> {
    auto* command = get(name);
    if (!command) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Unknown command", std::string(name)));
    }

    LOG_DEBUG("Executing command: {} ({} args)", name, args.size());

    auto outcome = command->execute(ctx, args);

    if (outcome == Outcome::Failure) {
        LOG_DEBUG("Command {} failed", name);
    }
    return outcome;
}

auto CommandRegistry::size() const noexcept -> std::size_t {
    return commands_.size();
}

auto CommandRegistry::contains(std::string_view name) const -> bool {
    return commands_.find(name) != commands_.end();
}

auto CommandRegistry::remove(std::string_view name) -> bool {
    auto it = commands_.find(name);
    if (it != commands_.end()) {
        LOG_DEBUG("Removed command: {}", name);
        commands_.erase(it);
        return true;
    }
    return false;
}

} // namespace safeterm::commands
