#include "safeterm/exec/command_executor.hpp"

#include "safeterm/core/logger.hpp"
#include "safeterm/core/utils.hpp"

namespace safeterm::exec {

auto find_dangerous_pattern(std::string_view arg) -> std::optional<std::string_view> {
    auto lowered = utils::to_lower(arg);
    for (auto pattern : kDangerousPatterns) {
        if (lowered.find(pattern) != std::string::npos) {
            return pattern;
        }
    }
    return std::nullopt;
}

CommandExecutor::CommandExecutor(sandbox::SandboxConfig& config)
    : config_(config)
    , sandbox_(config)
    , deleter_(config) {}

auto CommandExecutor::validate_args(const std::vector<std::string>& args) const -> bool {
    bool flagged = false;
    for (const auto& arg : args) {
        if (auto pattern = find_dangerous_pattern(arg)) {
            LOG_WARN("Potentially dangerous argument: {} (matches '{}')", arg, *pattern);
            flagged = true;
        }
    }

    if (flagged && config_.safe_mode()) {
        LOG_WARN("Arguments rejected in safe mode");
        return false;
    }
    return true;
}

} // namespace safeterm::exec
