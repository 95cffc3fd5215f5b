#include "safeterm/commands/builtins.hpp"

#include "safeterm/core/logger.hpp"
#include "safeterm/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <sstream>
#include <sys/stat.h>

namespace safeterm::commands {

namespace fs = std::filesystem;

namespace {

struct ListedEntry {
    fs::path path;
    std::string name;
    bool is_dir = false;
    bool is_symlink = false;
};

auto make_entry(const fs::path& path) -> ListedEntry {
    std::error_code ec;
    ListedEntry entry;
    entry.path = path;
    entry.name = path.filename().string();
    entry.is_symlink = fs::is_symlink(fs::symlink_status(path, ec));
    entry.is_dir = fs::is_directory(path, ec);
    return entry;
}

auto is_executable_name(const fs::path& path) -> bool {
    static constexpr std::array<std::string_view, 4> kExecutableSuffixes = {
        ".py", ".exe", ".bat", ".sh",
    };
    auto ext = path.extension().string();
    std::string_view suffix = ext;
    return std::ranges::find(kExecutableSuffixes, suffix) != kExecutableSuffixes.end();
}

auto display_name(const ListedEntry& entry, bool colors) -> std::string {
    if (entry.is_dir) {
        return colorize(entry.name + "/", Color::Blue, colors);
    }
    if (entry.is_symlink) {
        return colorize(entry.name, Color::Cyan, colors);
    }
    if (is_executable_name(entry.path)) {
        return colorize(entry.name, Color::Green, colors);
    }
    return entry.name;
}

auto format_mtime(std::time_t mtime) -> std::string {
    struct tm tm_val{};
    localtime_r(&mtime, &tm_val);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%b %d %H:%M", &tm_val);
    return buf;
}

void print_long(CommandContext& ctx, const std::vector<ListedEntry>& entries) {
    std::vector<std::array<std::string, 4>> rows;
    rows.reserve(entries.size());

    for (const auto& entry : entries) {
        struct stat st{};
        if (::lstat(entry.path.c_str(), &st) != 0) {
            rows.push_back({"?", "?", "?", colorize(entry.name, Color::Red, ctx.colors_enabled)});
            continue;
        }
        rows.push_back({
            format_mode(st.st_mode),
            entry.is_dir ? std::string("-") : format_size(static_cast<std::uintmax_t>(st.st_size)),
            format_mtime(st.st_mtime),
            display_name(entry, ctx.colors_enabled),
        });
    }

    std::size_t size_width = 0;
    for (const auto& row : rows) {
        size_width = std::max(size_width, row[1].size());
    }

    for (const auto& row : rows) {
        ctx.out << colorize(row[0], Color::Dim, ctx.colors_enabled) << "  "
                << std::string(size_width - row[1].size(), ' ')
                << colorize(row[1], Color::Dim, ctx.colors_enabled) << "  "
                << colorize(row[2], Color::Dim, ctx.colors_enabled) << "  "
                << row[3] << "\n";
    }
}

} // anonymous namespace

auto format_size(std::uintmax_t bytes) -> std::string {
    static constexpr std::array<char, 5> kUnits = {'B', 'K', 'M', 'G', 'T'};

    auto size = static_cast<double>(bytes);
    for (char unit : kUnits) {
        if (size < 1024.0) {
            std::ostringstream oss;
            if (size == std::floor(size)) {
                oss << static_cast<std::uintmax_t>(size) << unit;
            } else {
                oss.setf(std::ios::fixed);
                oss.precision(1);
                oss << size << unit;
            }
            return oss.str();
        }
        size /= 1024.0;
    }

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << size << 'P';
    return oss.str();
}

auto format_mode(unsigned int st_mode) -> std::string {
    std::string mode(10, '-');
    if (S_ISDIR(st_mode)) mode[0] = 'd';
    else if (S_ISLNK(st_mode)) mode[0] = 'l';
    else if (S_ISCHR(st_mode)) mode[0] = 'c';
    else if (S_ISBLK(st_mode)) mode[0] = 'b';
    else if (S_ISFIFO(st_mode)) mode[0] = 'p';
    else if (S_ISSOCK(st_mode)) mode[0] = 's';

    static constexpr std::array<unsigned int, 9> kBits = {
        S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP, S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH,
    };
    static constexpr std::string_view kChars = "rwxrwxrwx";
    for (std::size_t i = 0; i < kBits.size(); ++i) {
        if (st_mode & kBits[i]) mode[i + 1] = kChars[i];
    }

    if (st_mode & S_ISUID) mode[3] = (st_mode & S_IXUSR) ? 's' : 'S';
    if (st_mode & S_ISGID) mode[6] = (st_mode & S_IXGRP) ? 's' : 'S';
    if (st_mode & S_ISVTX) mode[9] = (st_mode & S_IXOTH) ? 't' : 'T';
    return mode;
}

auto LsCommand::help() const -> std::string {
    return "ls [-a|--all] [-l|--long] [path] - List directory contents";
}

auto LsCommand::execute(CommandContext& ctx, const std::vector<std::string>& args) -> Outcome {
    bool show_all = has_flag(args, 'a', "--all");
    bool long_format = has_flag(args, 'l', "--long");

    auto targets = operands(args);
    std::string target = targets.empty() ? "." : targets.front();

    auto& paths = ctx.executor.sandbox();
    auto resolved = paths.resolve(target);
    if (!resolved) {
        report(ctx, resolved.error().to_error());
        return Outcome::Failure;
    }

    std::error_code ec;
    auto status = fs::status(resolved->path(), ec);
    if (status.type() == fs::file_type::not_found) {
        ctx.err << colorize("No such file or directory: " + target, Color::Red, ctx.colors_enabled) << "\n";
        return Outcome::Failure;
    }

    if (!paths.check_permission(*resolved, sandbox::Permission::Read)) {
        report(ctx, make_error(ErrorCode::PermissionDenied, "Permission denied", resolved->string()));
        return Outcome::Failure;
    }

    if (!fs::is_directory(status)) {
        auto entry = make_entry(resolved->path());
        if (long_format) {
            print_long(ctx, {entry});
        } else {
            ctx.out << display_name(entry, ctx.colors_enabled) << "\n";
        }
        return Outcome::Success;
    }

    std::vector<ListedEntry> entries;
    fs::directory_iterator it(resolved->path(), ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (!show_all && name.starts_with(".")) {
            continue;
        }
        entries.push_back(make_entry(it->path()));
    }
    if (ec) {
        LOG_WARN("Failed to read directory {}: {}", resolved->string(), ec.message());
        report(ctx, make_error(ErrorCode::PermissionDenied,
            "Permission denied reading directory", resolved->string()));
        return Outcome::Failure;
    }

    std::ranges::sort(entries, [](const ListedEntry& a, const ListedEntry& b) {
        if (a.is_dir != b.is_dir) return a.is_dir;
        return utils::to_lower(a.name) < utils::to_lower(b.name);
    });

    if (long_format) {
        print_long(ctx, entries);
    } else {
        for (const auto& entry : entries) {
            ctx.out << display_name(entry, ctx.colors_enabled) << "\n";
        }
    }
    return Outcome::Success;
}

} // namespace safeterm::commands
