#include "safeterm/core/config.hpp"
#include "safeterm/core/logger.hpp"
#include "safeterm/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace safeterm {

auto load_config(const std::filesystem::path& path) -> Config {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        config.allowed_root = resolve_env_refs(config.allowed_root);
        config.recycle_bin = resolve_env_refs(config.recycle_bin);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("SAFETERM_ROOT")) {
        config.allowed_root = resolve_env_refs(val);
    }
    if (auto* val = std::getenv("SAFETERM_RECYCLE_BIN")) {
        config.recycle_bin = resolve_env_refs(val);
    }
    if (auto* val = std::getenv("SAFETERM_SAFE_MODE")) {
        config.safe_mode = parse_bool_flag(val, config.safe_mode);
    }
    if (auto* val = std::getenv("SAFETERM_DRY_RUN")) {
        config.dry_run = parse_bool_flag(val, config.dry_run);
    }
    if (auto* val = std::getenv("SAFETERM_LOG_LEVEL")) {
        config.log_level = val;
    }
}

auto parse_bool_flag(std::string_view value, bool fallback) -> bool {
    auto lowered = utils::to_lower(utils::trim(value));
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    LOG_WARN("Unrecognized boolean value '{}', keeping {}", value, fallback);
    return fallback;
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));

                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace safeterm
