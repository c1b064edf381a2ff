// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolchain/Fetcher.hpp>
#include <toolchain/ToolchainState.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <span>
#include <stop_token>
#include <string_view>

namespace apkforge
{

/// @brief Settings of a ToolchainProvisioner.
struct ProvisionerConfig
{
    /// Managed root; holds toolchain-state.json, components/, sdk/, downloads/ and staging/.
    std::filesystem::path root;

    /// Consent to record licenses that components require. Without it such installs fail.
    bool acceptLicenses = false;

    /// Download (or sdkmanager) attempts per component before giving up.
    int downloadAttempts = 3;

    /// Upper bound for one extraction or sdkmanager run.
    std::chrono::milliseconds installTimeout = std::chrono::minutes { 30 };
};

/// @brief Installs build toolchain components below a managed root and keeps their records.
///
/// All operations of one instance are mutually exclusive. An install is downloaded, verified,
/// unpacked into a staging directory and renamed into place before its record is written, and
/// the in-memory state only changes once the record is on disk. A failure at any step leaves
/// both the state file and the in-memory state exactly as they were.
class ToolchainProvisioner
{
  public:
    /// @brief Constructs a provisioner. Nothing is read until the first call.
    /// @param config Root, consent and retry settings.
    /// @param fetcher Downloads archives; must outlive the provisioner.
    ToolchainProvisioner(ProvisionerConfig config, Fetcher& fetcher);
    ~ToolchainProvisioner();

    ToolchainProvisioner(const ToolchainProvisioner&) = delete;
    ToolchainProvisioner& operator=(const ToolchainProvisioner&) = delete;

    /// @brief Makes sure every component is installed, in the given order.
    ///
    /// Components already recorded with the same id and version are left alone, so a second
    /// call with the same list performs no download and returns an identical state.
    /// @param components The required components.
    /// @param stopToken Cancels an in-flight download or install.
    /// @return The resulting state, or ToolchainInstallError, LicenseGateError or Cancelled.
    [[nodiscard]] auto ensureReady(std::span<const ComponentSpec> components, std::stop_token stopToken)
        -> Result<ToolchainState>;

    /// @brief Records acceptance of a license regardless of the configured consent.
    ///
    /// This is the explicit consent step behind `provision --accept-licenses`.
    /// @return The resulting state, or a LicenseGateError if the record cannot be persisted.
    [[nodiscard]] auto acceptLicense(std::string_view licenseId) -> Result<ToolchainState>;

    /// @brief Returns the current state, loading it from disk on first use.
    [[nodiscard]] auto state() -> Result<ToolchainState>;

    /// @brief Returns the path of the persisted state.
    [[nodiscard]] auto stateFilePath() const -> std::filesystem::path;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace apkforge
