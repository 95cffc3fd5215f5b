#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "safeterm/core/error.hpp"
#include "safeterm/sandbox/path_sandbox.hpp"
#include "safeterm/sandbox/sandbox_config.hpp"

namespace safeterm::sandbox {

/// Upper bound on `stem_<n>` candidates tried before giving up.
static constexpr int kMaxRecycleSuffix = 100000;

/// A path that was moved (or, in dry-run mode, would have been moved)
/// into the recycle directory.
struct RecycleEntry {
    std::filesystem::path original_path;
    std::filesystem::path recycled_path;
    bool simulated = false;

    /// File name of the entry inside the recycle directory.
    [[nodiscard]] auto name() const -> std::string { return recycled_path.filename().string(); }
};

/// Move or copy into the recycle directory failed. The source is left in
/// place unless `reason` says otherwise.
struct DeleteFailed {
    std::filesystem::path path;
    std::string reason;

    [[nodiscard]] auto what() const -> std::string;
    [[nodiscard]] auto to_error() const -> Error;
};

/// Soft-deletes sandboxed paths by relocating them into the recycle
/// directory. Collisions get `stem_1.ext`, `stem_2.ext`, ... so repeated
/// deletions of same-named items never overwrite each other.
class ReversibleDeleter {
public:
    explicit ReversibleDeleter(const SandboxConfig& config);

    /// Moves `path` into the recycle directory. With dry_run set nothing is
    /// touched and the returned entry is marked simulated.
    [[nodiscard]] auto delete_path(const ResolvedPath& path)
        -> std::expected<RecycleEntry, DeleteFailed>;

    /// First unused destination for `original` in the recycle directory.
    /// Returns an empty path when every candidate is taken.
    [[nodiscard]] auto next_recycle_name(const std::filesystem::path& original) const
        -> std::filesystem::path;

private:
    /// rename(2) that refuses to replace an existing destination where the
    /// platform supports it.
    auto move_no_replace(const std::filesystem::path& from,
                         const std::filesystem::path& to) const -> std::error_code;

    auto copy_then_remove(const std::filesystem::path& source,
                          const std::filesystem::path& destination) const
        -> std::expected<std::filesystem::path, DeleteFailed>;

    const SandboxConfig& config_;
};

} // namespace safeterm::sandbox
