#include "safeterm/commands/command.hpp"

#include "safeterm/core/logger.hpp"

namespace safeterm::commands {

auto colorize(std::string_view text, Color color, bool enabled) -> std::string {
    if (!enabled) {
        return std::string(text);
    }

    std::string_view code;
    switch (color) {
        case Color::Red: code = "\033[31m"; break;
        case Color::Green: code = "\033[32m"; break;
        case Color::Yellow: code = "\033[33m"; break;
        case Color::Blue: code = "\033[34m"; break;
        case Color::Cyan: code = "\033[36m"; break;
        case Color::Dim: code = "\033[2m"; break;
    }

    std::string result;
    result.reserve(text.size() + code.size() + 4);
    result += code;
    result += text;
    result += "\033[0m";
    return result;
}

void report(CommandContext& ctx, const Error& error) {
    LOG_DEBUG("[{}] {}", error_code_to_string(error.code()), error.what());
    ctx.err << colorize(error.what(), Color::Red, ctx.colors_enabled) << "\n";
}

auto has_flag(const std::vector<std::string>& args, char short_flag,
              std::string_view long_flag) -> bool {
    for (const auto& arg : args) {
        if (arg == long_flag) {
            return true;
        }
        if (arg.size() >= 2 && arg[0] == '-' && arg[1] != '-' &&
            arg.find(short_flag, 1) != std::string::npos) {
            return true;
        }
    }
    return false;
}

auto operands(const std::vector<std::string>& args) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& arg : args) {
        if (!arg.starts_with("-")) {
            result.push_back(arg);
        }
    }
    return result;
}

} // namespace safeterm::commands
