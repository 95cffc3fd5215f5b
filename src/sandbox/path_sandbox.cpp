#include "safeterm/sandbox/path_sandbox.hpp"

#include "safeterm/core/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <deque>
#include <unistd.h>

namespace safeterm::sandbox {

namespace fs = std::filesystem;

auto SandboxViolation::what() const -> std::string {
    auto text = "Access denied: " + rejected_path + " is outside allowed root " +
                allowed_root.string();
    if (!reason.empty()) {
        text += " (" + reason + ")";
    }
    return text;
}

auto SandboxViolation::to_error() const -> Error {
    return make_error(ErrorCode::SandboxViolation,
        "Access denied: " + rejected_path + " is outside allowed root " + allowed_root.string(),
        reason);
}

auto ResolvedPath::is_descendant_of(const fs::path& root) const -> bool {
    return is_within(path_, root);
}

auto is_within(const fs::path& child, const fs::path& root) -> bool {
    auto [root_it, child_it] = std::mismatch(root.begin(), root.end(),
                                             child.begin(), child.end());
    if (root_it == root.end()) {
        return true;
    }
    // A trailing separator on the root shows up as one empty final element.
    return root_it->empty() && std::next(root_it) == root.end();
}

auto canonicalize_lenient(const fs::path& path) -> Result<fs::path> {
    if (!path.is_absolute()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Path must be absolute", path.string()));
    }

    auto relative = path.relative_path();
    std::deque<fs::path> pending(relative.begin(), relative.end());
    fs::path resolved = path.root_path();
    int hops = 0;

    while (!pending.empty()) {
        auto component = std::move(pending.front());
        pending.pop_front();

        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            // parent_path() of "/" is "/"
            resolved = resolved.parent_path();
            continue;
        }

        auto next = resolved / component;
        std::error_code ec;
        auto status = fs::symlink_status(next, ec);

        // ENOENT: keep the segment as written. ENOTDIR is an error.
        if (status.type() == fs::file_type::not_found && ec != std::errc::not_a_directory) {
            resolved = std::move(next);
            continue;
        }
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot inspect path component", next.string() + ": " + ec.message()));
        }

        if (status.type() == fs::file_type::symlink) {
            if (++hops > kMaxSymlinkHops) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                    "Too many levels of symbolic links", path.string()));
            }

            auto target = fs::read_symlink(next, ec);
            if (ec) {
                return std::unexpected(make_error(ErrorCode::IoError,
                    "Failed to read symlink", next.string() + ": " + ec.message()));
            }

            // Relative targets continue from the link's own directory.
            if (target.is_absolute()) {
                resolved = target.root_path();
                target = target.relative_path();
            }
            pending.insert(pending.begin(), target.begin(), target.end());
            continue;
        }

        if (status.type() != fs::file_type::directory && !pending.empty()) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Not a directory", next.string()));
        }
        resolved = std::move(next);
    }

    return resolved;
}

auto expand_home(std::string_view path) -> std::string {
    if (path != "~" && !path.starts_with("~/")) {
        return std::string(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return std::string(path);
    }
    return std::string(home) + std::string(path.substr(1));
}

PathSandbox::PathSandbox(const SandboxConfig& config)
    : config_(config)
    , cwd_(initial_directory(config)) {}

auto PathSandbox::initial_directory(const SandboxConfig& config) -> ResolvedPath {
    std::error_code ec;
    auto process_cwd = fs::current_path(ec);
    if (!ec) {
        auto canonical = fs::canonical(process_cwd, ec);
        if (!ec && is_within(canonical, config.allowed_root())) {
            return ResolvedPath(std::move(canonical));
        }
    }
    return ResolvedPath(config.allowed_root());
}

auto PathSandbox::absolute_input(std::string_view path_str) const -> fs::path {
    fs::path candidate(expand_home(path_str));
    if (!candidate.is_absolute()) {
        candidate = cwd_.path() / candidate;
    }
    return candidate;
}

auto PathSandbox::resolve(std::string_view path_str) const
    -> std::expected<ResolvedPath, SandboxViolation> {
    if (path_str.find('\0') != std::string_view::npos) {
        LOG_WARN("Rejected path containing NUL byte");
        return std::unexpected(violation(path_str, "path contains a NUL byte"));
    }

    auto canonical = canonicalize_lenient(absolute_input(path_str));
    if (!canonical) {
        LOG_WARN("Invalid path {}: {}", path_str, canonical.error().what());
        return std::unexpected(violation(path_str, canonical.error().what()));
    }

    if (!is_within(*canonical, config_.allowed_root())) {
        LOG_WARN("Sandbox violation: {} resolves to {} outside {}",
                 path_str, canonical->string(), config_.allowed_root().string());
        return std::unexpected(violation(path_str,
            "resolves to " + canonical->string()));
    }

    LOG_DEBUG("Resolved {} -> {}", path_str, canonical->string());
    return ResolvedPath(std::move(*canonical));
}

auto PathSandbox::resolve_entry(std::string_view path_str) const
    -> std::expected<ResolvedPath, SandboxViolation> {
    if (path_str.find('\0') != std::string_view::npos) {
        LOG_WARN("Rejected path containing NUL byte");
        return std::unexpected(violation(path_str, "path contains a NUL byte"));
    }

    auto candidate = absolute_input(path_str);
    auto name = candidate.filename();
    if (name.empty() || name == "." || name == "..") {
        return resolve(path_str);
    }

    auto parent = canonicalize_lenient(candidate.parent_path());
    if (!parent) {
        LOG_WARN("Invalid path {}: {}", path_str, parent.error().what());
        return std::unexpected(violation(path_str, parent.error().what()));
    }

    auto entry = *parent / name;
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(entry, ec))) {
        return resolve(path_str);
    }

    if (!is_within(entry, config_.allowed_root())) {
        LOG_WARN("Sandbox violation: {} names {} outside {}",
                 path_str, entry.string(), config_.allowed_root().string());
        return std::unexpected(violation(path_str, "resolves to " + entry.string()));
    }

    LOG_DEBUG("Resolved link entry {} -> {}", path_str, entry.string());
    return ResolvedPath(std::move(entry));
}

auto PathSandbox::check_permission(const ResolvedPath& path, Permission kind) const -> bool {
    std::error_code ec;
    auto status = fs::symlink_status(path.path(), ec);
    if (status.type() == fs::file_type::not_found) {
        return kind == Permission::Write;
    }
    if (ec) {
        LOG_WARN("Cannot stat {}: {}", path.string(), ec.message());
        return false;
    }

    const bool parent_writable = ::access(path.path().parent_path().c_str(), W_OK) == 0;
    if (fs::is_symlink(status)) {
        // Only the link itself is at stake; its target may be anywhere.
        return kind == Permission::Delete ? parent_writable : false;
    }

    switch (kind) {
        case Permission::Read:
            return ::access(path.path().c_str(), R_OK) == 0;
        case Permission::Write:
            return ::access(path.path().c_str(), W_OK) == 0;
        case Permission::Delete:
            return ::access(path.path().c_str(), W_OK) == 0 && parent_writable;
    }
    return false;
}

auto PathSandbox::change_directory(const ResolvedPath& dir) -> VoidResult {
    std::error_code ec;
    auto status = fs::status(dir.path(), ec);
    if (status.type() == fs::file_type::not_found) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Directory not found", dir.string()));
    }
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot stat directory", dir.string() + ": " + ec.message()));
    }
    if (status.type() != fs::file_type::directory) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Not a directory", dir.string()));
    }

    cwd_ = dir;
    LOG_DEBUG("Working directory is now {}", cwd_.string());
    return {};
}

auto PathSandbox::root() const -> ResolvedPath {
    return ResolvedPath(config_.allowed_root());
}

auto PathSandbox::violation(std::string_view input, std::string reason) const
    -> SandboxViolation {
    return SandboxViolation{std::string(input), config_.allowed_root(), std::move(reason)};
}

} // namespace safeterm::sandbox
