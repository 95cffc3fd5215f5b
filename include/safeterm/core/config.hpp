#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace safeterm {

using json = nlohmann::json;

/// Startup configuration as read from the JSON config file, the
/// environment and the command line. SandboxConfig is built from this.
struct Config {
    std::string allowed_root = ".";
    std::string recycle_bin = ".recycle_bin";  // relative values live under allowed_root
    bool safe_mode = true;
    bool dry_run = false;
    std::string log_level = "info";
    bool colors_enabled = true;
    std::string prompt = "> ";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, allowed_root, recycle_bin, safe_mode, dry_run, log_level, colors_enabled, prompt)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// Applies SAFETERM_* environment variables on top of an existing config.
void apply_env_overrides(Config& config);

/// Parses "1", "true", "yes", "on" (any case) as true and
/// "0", "false", "no", "off" as false. Anything else yields `fallback`.
auto parse_bool_flag(std::string_view value, bool fallback) -> bool;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace safeterm
