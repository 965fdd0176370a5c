#include "zshrcman/installer.hpp"

#include <spdlog/spdlog.h>

namespace zshrcman {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

Result<void> RecordOnlyInstaller::install(const std::vector<std::string>& packages,
                                          InstallScope scope) {
    spdlog::info("recording install of [{}] with scope {}", join(packages),
                 install_scope_to_string(scope));
    return Result<void>::ok();
}

Result<void> RecordOnlyInstaller::uninstall(const std::vector<std::string>& packages) {
    spdlog::info("recording uninstall of [{}]", join(packages));
    return Result<void>::ok();
}

} // namespace zshrcman
