#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "safeterm/core/error.hpp"
#include "safeterm/sandbox/sandbox_config.hpp"

namespace safeterm::sandbox {

/// Maximum number of symlinks followed while canonicalizing one path,
/// matching Linux's MAXSYMLINKS.
static constexpr int kMaxSymlinkHops = 40;

/// A path string was rejected because it does not canonicalize to a
/// location inside the allowed root.
struct SandboxViolation {
    std::string rejected_path;
    std::filesystem::path allowed_root;
    std::string reason;

    [[nodiscard]] auto what() const -> std::string;
    [[nodiscard]] auto to_error() const -> Error;
};

/// Canonical absolute path that was inside the allowed root when it was
/// resolved. Only PathSandbox can produce one.
class ResolvedPath {
public:
    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto string() const -> std::string { return path_.string(); }

    /// True if this path equals `root` or lies beneath it.
    [[nodiscard]] auto is_descendant_of(const std::filesystem::path& root) const -> bool;

    bool operator==(const ResolvedPath& other) const = default;

private:
    friend class PathSandbox;
    explicit ResolvedPath(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

enum class Permission {
    Read,
    Write,
    Delete,
};

/// Component-wise containment: true if `child` equals `root` or descends
/// from it. Both paths must already be canonical. `/root2` is not inside
/// `/root`.
auto is_within(const std::filesystem::path& child, const std::filesystem::path& root) -> bool;

/// Canonicalizes an absolute path the way realpath(3) does, except that
/// components which do not exist are appended verbatim instead of failing.
/// `..` pops the already-resolved prefix, so it is applied after any
/// symlink to its left has been followed.
///
/// Fails with ErrorCode::IoError if a component cannot be inspected (other
/// than not existing), or with ErrorCode::InvalidArgument on a symlink loop
/// or a relative input.
auto canonicalize_lenient(const std::filesystem::path& path)
    -> Result<std::filesystem::path>;

/// Expands a leading `~` or `~/` to $HOME. Other strings are returned
/// unchanged, as is everything when HOME is unset.
auto expand_home(std::string_view path) -> std::string;

/// Resolves caller-supplied path strings to locations inside the allowed
/// root and answers advisory permission queries.
///
/// Relative inputs are joined to the sandbox's own working directory, which
/// starts at the process working directory when that lies inside the root
/// and at the root otherwise.
class PathSandbox {
public:
    explicit PathSandbox(const SandboxConfig& config);

    /// Resolve `path_str` to a canonical path inside the allowed root.
    [[nodiscard]] auto resolve(std::string_view path_str) const
        -> std::expected<ResolvedPath, SandboxViolation>;

    /// Like resolve(), but a symlink in the final component is not
    /// followed: the result names the link itself. Used where the
    /// operation acts on the directory entry (removal).
    [[nodiscard]] auto resolve_entry(std::string_view path_str) const
        -> std::expected<ResolvedPath, SandboxViolation>;

    /// Advisory check. A nonexistent path permits only Write; Delete needs
    /// write access to both the path and its parent directory, or only to
    /// the parent when the path is a symlink.
    [[nodiscard]] auto check_permission(const ResolvedPath& path, Permission kind) const -> bool;

    [[nodiscard]] auto working_directory() const noexcept -> const ResolvedPath& { return cwd_; }

    /// Make `dir` the base for relative inputs. It must be an existing directory.
    auto change_directory(const ResolvedPath& dir) -> VoidResult;

    [[nodiscard]] auto root() const -> ResolvedPath;
    [[nodiscard]] auto config() const noexcept -> const SandboxConfig& { return config_; }

private:
    static auto initial_directory(const SandboxConfig& config) -> ResolvedPath;
    auto absolute_input(std::string_view path_str) const -> std::filesystem::path;
    auto violation(std::string_view input, std::string reason) const -> SandboxViolation;

    const SandboxConfig& config_;
    ResolvedPath cwd_;
};

} // namespace safeterm::sandbox
