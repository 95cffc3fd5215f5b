#include "safeterm/commands/builtins.hpp"

#include <filesystem>

namespace safeterm::commands {

namespace fs = std::filesystem;

auto CdCommand::help() const -> std::string {
    return "cd [directory] - Change current directory";
}

auto CdCommand::execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome {
    auto& paths = ctx.executor.sandbox();

    auto targets = operands(args);
    auto resolved = targets.empty()
        ? std::expected<sandbox::ResolvedPath, sandbox::SandboxViolation>(paths.root())
        : paths.resolve(targets.front());
    const std::string target = targets.empty() ? paths.root().string() : targets.front();

    if (!resolved) {
        report(ctx, resolved.error().to_error());
        return Outcome::Failure;
    }

    std::error_code ec;
    auto status = fs::status(resolved->path(), ec);
    if (status.type() == fs::file_type::not_found) {
        ctx.err << colorize("Directory not found: " + target, Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }
    if (!fs::is_directory(status)) {
        ctx.err << colorize("Not a directory: " + target, Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }
    if (!paths.check_permission(*resolved, sandbox::Permission::Read)) {
        report(ctx, make_error(ErrorCode::PermissionDenied, "Permission denied", resolved->string()));
        return Outcome::Failure;
    }

    if (auto changed = paths.change_directory(*resolved); !changed) {
        report(ctx, changed.error());
        return Outcome::Failure;
    }
    return Outcome::Success;
}

} // namespace safeterm::commands
