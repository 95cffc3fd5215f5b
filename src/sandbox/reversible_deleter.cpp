#include "safeterm/sandbox/reversible_deleter.hpp"

#include "safeterm/core/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <fcntl.h>

namespace safeterm::sandbox {

namespace fs = std::filesystem;

namespace {

/// Number of times a move is retried with a fresh name when another
/// entry appeared under the chosen one in the meantime.
constexpr int kMaxNameRaces = 8;

/// Any directory entry counts, dangling symlinks included.
auto entry_exists(const fs::path& path) -> bool {
    std::error_code ec;
    return fs::symlink_status(path, ec).type() != fs::file_type::not_found;
}

auto suffixed_name(const fs::path& original, int n) -> fs::path {
    // stem()/extension() split at the last dot; ".bashrc" has no extension.
    return original.stem().string() + "_" + std::to_string(n) + original.extension().string();
}

} // anonymous namespace

auto DeleteFailed::what() const -> std::string {
    return "Failed to delete " + path.string() + ": " + reason;
}

auto DeleteFailed::to_error() const -> Error {
    return make_error(ErrorCode::DeleteFailed, "Failed to delete " + path.string(), reason);
}

ReversibleDeleter::ReversibleDeleter(const SandboxConfig& config)
    : config_(config) {}

auto ReversibleDeleter::next_recycle_name(const fs::path& original) const -> fs::path {
    auto candidate = config_.recycle_dir() / original.filename();
    if (!entry_exists(candidate)) {
        return candidate;
    }
    for (int n = 1; n <= kMaxRecycleSuffix; ++n) {
        candidate = config_.recycle_dir() / suffixed_name(original.filename(), n);
        if (!entry_exists(candidate)) {
            return candidate;
        }
    }
    return {};
}

auto ReversibleDeleter::delete_path(const ResolvedPath& path)
    -> std::expected<RecycleEntry, DeleteFailed> {
    // Sampled once; a concurrent toggle applies to the next call.
    const bool dry_run = config_.dry_run();
    const auto& source = path.path();

    std::error_code ec;
    auto status = fs::symlink_status(source, ec);
    if (status.type() == fs::file_type::not_found) {
        return std::unexpected(DeleteFailed{source, "No such file or directory"});
    }
    if (ec) {
        return std::unexpected(DeleteFailed{source, ec.message()});
    }

    if (source == config_.allowed_root()) {
        LOG_WARN("Refusing to recycle the allowed root {}", source.string());
        return std::unexpected(DeleteFailed{source, "refusing to recycle the allowed root"});
    }
    if (is_within(config_.recycle_dir(), source)) {
        LOG_WARN("Refusing to recycle {}: it contains the recycle directory", source.string());
        return std::unexpected(DeleteFailed{source,
            "refusing to recycle the recycle directory or one of its parents"});
    }
    if (is_within(source, config_.recycle_dir())) {
        LOG_WARN("Refusing to recycle {}: it is already in the recycle directory", source.string());
        return std::unexpected(DeleteFailed{source, "already in the recycle directory"});
    }

    auto destination = next_recycle_name(source);
    if (destination.empty()) {
        return std::unexpected(DeleteFailed{source, "no free name left in the recycle directory"});
    }

    if (dry_run) {
        LOG_INFO("DRY RUN: would move {} to recycle bin as {}",
                 source.string(), destination.string());
        return RecycleEntry{source, destination, true};
    }

    for (int attempt = 0;; ++attempt) {
        ec = move_no_replace(source, destination);
        if (!ec) {
            break;
        }

        if (ec == std::errc::file_exists && attempt < kMaxNameRaces) {
            LOG_DEBUG("Recycle name {} was taken concurrently, retrying", destination.string());
            destination = next_recycle_name(source);
            if (destination.empty()) {
                return std::unexpected(DeleteFailed{source,
                    "no free name left in the recycle directory"});
            }
            continue;
        }

        if (ec == std::errc::cross_device_link) {
            LOG_DEBUG("{} and recycle directory are on different filesystems, copying",
                      source.string());
            auto copied = copy_then_remove(source, destination);
            if (!copied) {
                LOG_ERROR("{}", copied.error().what());
                return std::unexpected(copied.error());
            }
            destination = std::move(*copied);
            break;
        }

        LOG_ERROR("Failed to move {} to {}: {}", source.string(), destination.string(), ec.message());
        return std::unexpected(DeleteFailed{source,
            "move to " + destination.string() + " failed: " + ec.message()});
    }

    LOG_INFO("Moved {} to recycle bin as {}", source.string(), destination.string());
    return RecycleEntry{source, destination, false};
}

auto ReversibleDeleter::move_no_replace(const fs::path& from, const fs::path& to) const
    -> std::error_code {
#ifdef __linux__
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return {};
    }
    int err = errno;
    // EINVAL/ENOSYS: the filesystem or kernel lacks RENAME_NOREPLACE.
    if (err != EINVAL && err != ENOSYS) {
        return std::error_code(err, std::generic_category());
    }
    if (entry_exists(to)) {
        return std::make_error_code(std::errc::file_exists);
    }
#endif
    std::error_code ec;
    fs::rename(from, to, ec);
    return ec;
}

auto ReversibleDeleter::copy_then_remove(const fs::path& source,
                                         const fs::path& destination) const
    -> std::expected<fs::path, DeleteFailed> {
    // Copy under a hidden staging name so a half-written copy never shows
    // up as a recycle entry.
    auto staging = destination.parent_path() /
                   ("." + destination.filename().string() + ".partial");
    if (entry_exists(staging)) {
        return std::unexpected(DeleteFailed{source,
            "staging path " + staging.string() + " already exists"});
    }

    std::error_code ec;
    auto status = fs::symlink_status(source, ec);
    if (!ec) {
        if (fs::is_symlink(status)) {
            fs::copy_symlink(source, staging, ec);
        } else {
            fs::copy(source, staging,
                     fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        }
    }
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
        return std::unexpected(DeleteFailed{source,
            "copy to recycle directory failed: " + ec.message()});
    }

    auto final_name = destination;
    for (int attempt = 0;; ++attempt) {
        ec = move_no_replace(staging, final_name);
        if (!ec) {
            break;
        }
        if (ec == std::errc::file_exists && attempt < kMaxNameRaces) {
            final_name = next_recycle_name(source);
            if (!final_name.empty()) {
                continue;
            }
        }
        std::error_code cleanup_ec;
        fs::remove_all(staging, cleanup_ec);
        return std::unexpected(DeleteFailed{source,
            "could not place copy in recycle directory: " +
                (ec ? ec.message() : std::string("no free name"))});
    }

    fs::remove_all(source, ec);
    if (ec) {
        // Part of the original may already be gone; the complete copy stays.
        return std::unexpected(DeleteFailed{source,
            "copied to " + final_name.string() + " but removing the original failed: " +
                ec.message() + "; the recycled copy was kept"});
    }

    return final_name;
}

} // namespace safeterm::sandbox
