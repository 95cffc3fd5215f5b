#include "safeterm/commands/builtins.hpp"

#include "safeterm/core/utils.hpp"

#include <filesystem>

namespace safeterm::commands {

namespace fs = std::filesystem;

namespace {

auto confirm(CommandContext& ctx, const std::string& prompt) -> bool {
    ctx.out << prompt << std::flush;
    std::string answer;
    if (!std::getline(ctx.in, answer)) {
        ctx.out << "\n";
        return false;
    }
    auto normalized = utils::to_lower(utils::trim(answer));
    return normalized == "y" || normalized == "yes";
}

} // anonymous namespace

auto RmCommand::help() const -> std::string {
    return "rm [-r|--recursive] [-f|--force] [-v|--verbose] file... - Remove files and directories";
}

auto RmCommand::execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome {
    if (args.empty()) {
        ctx.err << colorize("rm: missing operand", Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }

    bool recursive = has_flag(args, 'r', "--recursive");
    bool force = has_flag(args, 'f', "--force");
    bool verbose = has_flag(args, 'v', "--verbose");

    auto files = operands(args);
    if (files.empty()) {
        ctx.err << colorize("rm: missing file operand", Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }

    auto& paths = ctx.executor.sandbox();
    bool success = true;

    for (const auto& file : files) {
        auto resolved = paths.resolve_entry(file);
        if (!resolved) {
            report(ctx, resolved.error().to_error());
            success = false;
            continue;
        }

        // Dangling symlinks are still removable entries.
        std::error_code ec;
        auto link_status = fs::symlink_status(resolved->path(), ec);
        if (link_status.type() == fs::file_type::not_found) {
            if (!force) {
                ctx.err << colorize("File not found: " + file, Color::Red, ctx.colors_enabled) << "\n";
                success = false;
            }
            continue;
        }

        bool is_dir = fs::is_directory(link_status);
        if (is_dir && !recursive) {
            ctx.err << colorize("Is a directory (use -r for recursive): " + file,
                                Color::Red, ctx.colors_enabled) << "\n";
            success = false;
            continue;
        }

        if (!paths.check_permission(*resolved, sandbox::Permission::Delete)) {
            report(ctx, make_error(ErrorCode::PermissionDenied, "Permission denied", resolved->string()));
            success = false;
            continue;
        }

        if (is_dir && !force) {
            if (!confirm(ctx, "Remove directory '" + resolved->string() + "' and all its contents? (y/N): ")) {
                ctx.out << "Cancelled\n";
                continue;
            }
        }

        auto entry = ctx.executor.deleter().delete_path(*resolved);
        if (!entry) {
            report(ctx, entry.error().to_error());
            success = false;
            continue;
        }

        if (entry->simulated) {
            ctx.out << colorize("DRY RUN: Would move " + resolved->string() +
                                " to recycle bin as " + entry->name(),
                                Color::Dim, ctx.colors_enabled) << "\n";
        } else if (verbose) {
            ctx.out << "Removed: " << resolved->string() << " -> " << entry->recycled_path.string() << "\n";
        }
    }

    return success ? Outcome::Success : Outcome::Failure;
}

} // namespace safeterm::commands
