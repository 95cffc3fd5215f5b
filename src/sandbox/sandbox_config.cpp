#include "safeterm/sandbox/sandbox_config.hpp"

#include "safeterm/core/logger.hpp"

#include <unistd.h>

namespace safeterm::sandbox {

namespace fs = std::filesystem;

SandboxConfig::SandboxConfig(fs::path allowed_root,
                             fs::path recycle_dir,
                             bool safe_mode,
                             bool dry_run)
    : allowed_root_(std::move(allowed_root))
    , recycle_dir_(std::move(recycle_dir))
    , safe_mode_(safe_mode)
    , dry_run_(dry_run) {}

namespace {

auto resolve_root(const Config& config) -> Result<fs::path> {
    std::error_code ec;
    fs::path root(config.allowed_root.empty() ? "." : config.allowed_root);
    auto canonical_root = fs::canonical(root, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "allowed_root cannot be resolved", root.string() + ": " + ec.message()));
    }
    if (!fs::is_directory(canonical_root, ec) || ec) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "allowed_root is not a directory", canonical_root.string()));
    }
    return canonical_root;
}

auto recycle_path(const Config& config, const fs::path& root) -> fs::path {
    fs::path recycle(config.recycle_bin.empty() ? ".recycle_bin" : config.recycle_bin);
    return recycle.is_relative() ? root / recycle : recycle;
}

} // anonymous namespace

auto SandboxConfig::validate(const Config& config) -> VoidResult {
    auto root = resolve_root(config);
    if (!root) {
        return std::unexpected(root.error());
    }

    std::error_code ec;
    auto recycle = recycle_path(config, *root);
    if (fs::exists(recycle, ec)) {
        if (!fs::is_directory(recycle, ec) || ec) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "recycle_bin is not a directory", recycle.string()));
        }
        return {};
    }

    // create_directories would start at the nearest existing ancestor.
    auto ancestor = recycle.parent_path();
    while (!ancestor.empty() && !fs::exists(ancestor, ec)) {
        ancestor = ancestor.parent_path();
    }
    if (ancestor.empty() || !fs::is_directory(ancestor, ec)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "recycle_bin cannot be created", recycle.string()));
    }
    if (::access(ancestor.c_str(), W_OK | X_OK) != 0) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "recycle_bin cannot be created", ancestor.string() + " is not writable"));
    }
    return {};
}

auto SandboxConfig::create(const Config& config) -> Result<std::unique_ptr<SandboxConfig>> {
    auto resolved_root = resolve_root(config);
    if (!resolved_root) {
        return std::unexpected(resolved_root.error());
    }
    auto canonical_root = std::move(*resolved_root);
    auto recycle = recycle_path(config, canonical_root);

    std::error_code ec;
    if (!fs::exists(recycle, ec)) {
        fs::create_directories(recycle, ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to create recycle directory", recycle.string() + ": " + ec.message()));
        }
        LOG_INFO("Created recycle directory {}", recycle.string());
    }

    auto canonical_recycle = fs::canonical(recycle, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to resolve recycle directory", recycle.string() + ": " + ec.message()));
    }
    if (!fs::is_directory(canonical_recycle, ec) || ec) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "recycle_bin is not a directory", canonical_recycle.string()));
    }

    LOG_DEBUG("Sandbox root={} recycle={} safe_mode={} dry_run={}",
              canonical_root.string(), canonical_recycle.string(),
              config.safe_mode, config.dry_run);

    return std::unique_ptr<SandboxConfig>(new SandboxConfig(
        std::move(canonical_root), std::move(canonical_recycle),
        config.safe_mode, config.dry_run));
}

} // namespace safeterm::sandbox
