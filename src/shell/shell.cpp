#include "safeterm/shell/shell.hpp"

#include "safeterm/core/logger.hpp"
#include "safeterm/core/utils.hpp"

#include <exception>

namespace safeterm::shell {

namespace {

constexpr std::size_t kMaxPromptPath = 40;

} // anonymous namespace

auto expand_alias(std::vector<std::string>& words) -> bool {
    if (words.empty()) {
        return false;
    }
    if (words[0] == "ll") {
        words[0] = "ls";
        words.insert(words.begin() + 1, "-l");
        return true;
    }
    if (words[0] == "la") {
        words[0] = "ls";
        words.insert(words.begin() + 1, "-a");
        return true;
    }
    return false;
}

Shell::Shell(exec::CommandExecutor& executor,
             commands::CommandRegistry& registry,
             std::ostream& out,
             std::ostream& err,
             std::istream& in,
             ShellOptions options)
    : executor_(executor)
    , registry_(registry)
    , out_(out)
    , err_(err)
    , in_(in)
    , options_(std::move(options)) {}

auto Shell::context() -> commands::CommandContext {
    return commands::CommandContext{executor_, out_, err_, in_, options_.colors_enabled};
}

auto Shell::execute(std::vector<std::string> words) -> commands::Outcome {
    using commands::Color;
    using commands::colorize;
    using commands::Outcome;

    if (words.empty()) {
        return Outcome::Success;
    }
    expand_alias(words);

    const std::string name = words[0];
    std::vector<std::string> args(words.begin() + 1, words.end());

    if (!registry_.contains(name)) {
        err_ << colorize("Unknown command: " + name, Color::Red, options_.colors_enabled) << "\n";
        err_ << "Type 'help' for available commands.\n";
        return Outcome::Failure;
    }

    auto ctx = context();
    if (!executor_.validate_args(args)) {
        commands::report(ctx, make_error(ErrorCode::ArgumentRejected,
                                         "Invalid or potentially dangerous arguments"));
        return Outcome::Failure;
    }

    try {
        auto result = registry_.execute(name, ctx, args);
        if (!result) {
            commands::report(ctx, result.error());
            return Outcome::Failure;
        }
        return *result;
    } catch (const std::exception& e) {
        LOG_ERROR("Command {} threw: {}", name, e.what());
        err_ << colorize("Error executing " + name + ": " + e.what(),
                         Color::Red, options_.colors_enabled) << "\n";
        return Outcome::Failure;
    }
}

auto Shell::execute_line(std::string_view line) -> commands::Outcome {
    auto trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return commands::Outcome::Success;
    }

    auto words = utils::shell_split(trimmed);
    if (!words) {
        auto ctx = context();
        commands::report(ctx, make_error(ErrorCode::ParseError, "Parse error", words.error().what()));
        return commands::Outcome::Failure;
    }
    return execute(std::move(*words));
}

auto Shell::prompt() const -> std::string {
    const auto& root = executor_.config().allowed_root();
    const auto& cwd = executor_.sandbox().working_directory().path();

    std::string display = "/";
    auto relative = cwd.lexically_relative(root);
    if (!relative.empty() && relative != ".") {
        display += relative.generic_string();
    }
    if (display.size() > kMaxPromptPath) {
        display = "..." + display.substr(display.size() - (kMaxPromptPath - 3));
    }

    return commands::colorize(display, commands::Color::Blue, options_.colors_enabled) + " " + options_.prompt;
}

auto Shell::run() -> int {
    LOG_INFO("Shell started in {}", executor_.sandbox().working_directory().string());
    out_ << "safeterm - type 'help' for available commands, 'exit' to quit.\n";

    std::string line;
    while (true) {
        out_ << prompt() << std::flush;
        if (!std::getline(in_, line)) {
            out_ << "\n";
            break;
        }
        if (execute_line(line) == commands::Outcome::Exit) {
            break;
        }
    }

    LOG_INFO("Shell exited");
    return 0;
}

} // namespace safeterm::shell
