#pragma once

#include <atomic>
#include <filesystem>
#include <memory>

#include "safeterm/core/config.hpp"
#include "safeterm/core/error.hpp"

namespace safeterm::sandbox {

/// Confinement settings shared by the resolver, the deleter and the
/// argument gate. Built once at startup and passed by reference; only
/// `dry_run` may change afterwards.
class SandboxConfig {
public:
    /// Canonicalizes `config.allowed_root` (relative to the process working
    /// directory), resolves the recycle directory (relative to the root) and
    /// creates it if absent.
    ///
    /// Fails with ErrorCode::InvalidConfig if the root does not exist or is
    /// not a directory, and ErrorCode::IoError if the recycle directory
    /// cannot be created.
    static auto create(const Config& config) -> Result<std::unique_ptr<SandboxConfig>>;

    /// Runs the same checks as create() without creating anything: the
    /// recycle directory must exist as a directory, or its nearest existing
    /// ancestor must be a writable directory.
    static auto validate(const Config& config) -> VoidResult;

    SandboxConfig(const SandboxConfig&) = delete;
    SandboxConfig& operator=(const SandboxConfig&) = delete;

    [[nodiscard]] auto allowed_root() const noexcept -> const std::filesystem::path& {
        return allowed_root_;
    }
    [[nodiscard]] auto recycle_dir() const noexcept -> const std::filesystem::path& {
        return recycle_dir_;
    }
    [[nodiscard]] auto safe_mode() const noexcept -> bool { return safe_mode_; }

    [[nodiscard]] auto dry_run() const noexcept -> bool {
        return dry_run_.load(std::memory_order_acquire);
    }
    void set_dry_run(bool enabled) noexcept {
        dry_run_.store(enabled, std::memory_order_release);
    }

private:
    SandboxConfig(std::filesystem::path allowed_root,
                  std::filesystem::path recycle_dir,
                  bool safe_mode,
                  bool dry_run);

    std::filesystem::path allowed_root_;
    std::filesystem::path recycle_dir_;
    bool safe_mode_;
    std::atomic<bool> dry_run_;
};

} // namespace safeterm::sandbox
