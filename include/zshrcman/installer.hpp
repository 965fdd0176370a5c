#pragma once

#include "zshrcman/result.hpp"
#include "zshrcman/types.hpp"

#include <string>
#include <vector>

namespace zshrcman {

// ============================================================================
// Installer Contract
// ============================================================================

/**
 * @brief Capability that installs or uninstalls packages
 *
 * The state engine only cares whether the installer reports success.
 * Concrete package managers (brew, npm, pnpm, ...) live outside the core.
 */
class Installer {
public:
    virtual ~Installer() = default;

    virtual Result<void> install(const std::vector<std::string>& packages, InstallScope scope) = 0;
    virtual Result<void> uninstall(const std::vector<std::string>& packages) = 0;
};

/**
 * @brief Installer that performs no package-manager work
 *
 * Logs each request and reports success, so only the ledger is updated.
 */
class RecordOnlyInstaller : public Installer {
public:
    Result<void> install(const std::vector<std::string>& packages, InstallScope scope) override;
    Result<void> uninstall(const std::vector<std::string>& packages) override;
};

} // namespace zshrcman
