#include "safeterm/commands/builtins.hpp"

#include "safeterm/core/logger.hpp"

#include <filesystem>

namespace safeterm::commands {

namespace fs = std::filesystem;

auto MkdirCommand::help() const -> std::string {
    return "mkdir [-p|--parents] [-v|--verbose] directory... - Create directories";
}

auto MkdirCommand::execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome {
    if (args.empty()) {
        ctx.err << colorize("mkdir: missing operand", Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }

    bool parents = has_flag(args, 'p', "--parents");
    bool verbose = has_flag(args, 'v', "--verbose");

    auto dirs = operands(args);
    if (dirs.empty()) {
        ctx.err << colorize("mkdir: missing directory operand", Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }

    auto& paths = ctx.executor.sandbox();
    const bool dry_run = ctx.executor.dry_run();
    bool success = true;

    for (const auto& dir : dirs) {
        auto resolved = paths.resolve(dir);
        if (!resolved) {
            report(ctx, resolved.error().to_error());
            success = false;
            continue;
        }

        std::error_code ec;
        if (fs::exists(resolved->path(), ec)) {
            ctx.out << colorize("Directory already exists: " + dir, Color::Yellow, ctx.colors_enabled) << "\n";
            continue;
        }

        auto parent = paths.resolve(resolved->path().parent_path().string());
        if (!parent) {
            report(ctx, parent.error().to_error());
            success = false;
            continue;
        }
        if (!paths.check_permission(*parent, sandbox::Permission::Write)) {
            report(ctx, make_error(ErrorCode::PermissionDenied, "Permission denied", parent->string()));
            success = false;
            continue;
        }
        if (!parents && !fs::is_directory(parent->path(), ec)) {
            ctx.err << colorize("mkdir: cannot create directory '" + dir +
                                "': No such file or directory", Color::Red, ctx.colors_enabled) << "\n";
            success = false;
            continue;
        }

        if (dry_run) {
            LOG_INFO("DRY RUN: would create directory {}", resolved->string());
            ctx.out << colorize("DRY RUN: Would create directory " + resolved->string(),
                                Color::Dim, ctx.colors_enabled) << "\n";
            continue;
        }

        bool created = parents ? fs::create_directories(resolved->path(), ec)
                               : fs::create_directory(resolved->path(), ec);
        if (ec) {
            LOG_WARN("mkdir {} failed: {}", resolved->string(), ec.message());
            ctx.err << colorize("Error creating " + dir + ": " + ec.message(),
                                Color::Red, ctx.colors_enabled) << "\n";
            success = false;
            continue;
        }
        if (!created) {
            ctx.out << colorize("Directory already exists: " + dir, Color::Yellow, ctx.colors_enabled) << "\n";
            continue;
        }

        if (verbose) {
            ctx.out << "Created directory: " << resolved->string() << "\n";
        }
    }

    return success ? Outcome::Success : Outcome::Failure;
}

} // namespace safeterm::commands
