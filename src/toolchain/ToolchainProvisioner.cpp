// SPDX-License-Identifier: Apache-2.0
#include "ToolchainProvisioner.hpp"

#include <core/LogTail.hpp>
#include <core/Checksum.hpp>
#include <core/FileUtils.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <core/Process.hpp>
#include <toolchain/AndroidCatalog.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <mutex>
#include <optional>
#include <utility>

#include <unistd.h>

namespace apkforge
{

namespace
{
    constexpr auto StateFileName = "toolchain-state.json";

    /// sdkmanager asks once per license; consent was already recorded when this is sent.
    constexpr auto LicenseAnswers = std::string_view { "y\ny\ny\ny\ny\ny\ny\ny\ny\ny\ny\ny\ny\ny\ny\ny\n" };

    /// Turns "build-tools;34.0.0" into a single path component.
    auto flatName(std::string_view id) -> std::string
    {
        auto name = std::string(id);
        std::ranges::replace(name, ';', '_');
        std::ranges::replace(name, '/', '_');
        return name;
    }

    /// Turns "build-tools;34.0.0" into "build-tools/34.0.0", sdkmanager's on-disk layout.
    auto sdkPackagePath(std::string_view id) -> std::filesystem::path
    {
        auto path = std::string(id);
        std::ranges::replace(path, ';', '/');
        return std::filesystem::path(path);
    }

    auto downloadFileName(const ComponentSpec& spec) -> std::string
    {
        auto url = std::string_view(spec.url);
        if (auto const query = url.find_first_of("?#"); query != std::string_view::npos)
            url = url.substr(0, query);
        auto const slash = url.rfind('/');
        auto name = slash == std::string_view::npos ? url : url.substr(slash + 1);
        return name.empty() ? flatName(spec.id) : std::string(name);
    }

    auto isZip(std::string_view url) -> bool
    {
        auto const query = url.find_first_of("?#");
        return url.substr(0, query).ends_with(".zip");
    }

    void removeQuietly(const std::filesystem::path& path)
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(path, ec);
        if (ec)
            log::warning("Cannot remove {}: {}", path.string(), ec.message());
    }

    /// If @p dir holds exactly one directory and nothing else, returns that directory.
    auto contentRoot(const std::filesystem::path& dir) -> std::filesystem::path
    {
        auto ec = std::error_code {};
        auto it = std::filesystem::directory_iterator(dir, ec);
        if (ec || it == std::filesystem::directory_iterator {})
            return dir;

        auto const first = *it;
        if (++it != std::filesystem::directory_iterator {})
            return dir;
        return first.is_directory() ? first.path() : dir;
    }

    auto moveIntoPlace(const std::filesystem::path& from, const std::filesystem::path& to) -> VoidResult
    {
        auto ec = std::error_code {};
        if (std::filesystem::exists(to, ec))
        {
            // Unrecorded leftover of an interrupted install.
            log::warning("Replacing unrecorded directory {}", to.string());
            std::filesystem::remove_all(to, ec);
            if (ec)
                return makeError(ErrorCode::ToolchainInstallError,
                                 std::format("Cannot remove stale {}: {}", to.string(), ec.message()));
        }
        std::filesystem::create_directories(to.parent_path(), ec);
        if (ec)
            return makeError(ErrorCode::ToolchainInstallError,
                             std::format("Cannot create {}: {}", to.parent_path().string(), ec.message()));
        std::filesystem::rename(from, to, ec);
        if (ec)
            return makeError(ErrorCode::ToolchainInstallError,
                             std::format("Cannot move {} to {}: {}", from.string(), to.string(), ec.message()));
        return {};
    }

    auto cancelled(std::string_view what) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::Cancelled, std::format("{} cancelled", what));
    }

    struct VerifiedDownload
    {
        std::filesystem::path file;
        std::string sha256;
    };

    struct StagedPackage
    {
        std::filesystem::path stagingDir;
        std::filesystem::path packageDir;
    };
} // namespace

struct ToolchainProvisioner::Impl
{
    ProvisionerConfig config;
    Fetcher& fetcher;

    std::mutex mutex;
    std::optional<ToolchainState> current;
    std::atomic<unsigned> stagingCounter = 0;

    Impl(ProvisionerConfig cfg, Fetcher& f): config(std::move(cfg)), fetcher(f) {}

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return config.root; }
    [[nodiscard]] auto stateFile() const -> std::filesystem::path { return config.root / StateFileName; }

    auto newStagingDirectory(std::string_view id) -> Result<std::filesystem::path>;

    auto loadLocked() -> Result<ToolchainState*>;
    auto commitLocked(ToolchainState candidate) -> VoidResult;

    auto recordLicenseLocked(std::string_view licenseId) -> VoidResult;
    auto writeLicenseFiles(const std::filesystem::path& sdkRoot, const ToolchainState& state) -> VoidResult;

    auto installLocked(const ComponentSpec& spec, std::stop_token stopToken) -> VoidResult;
    auto downloadVerified(const ComponentSpec& spec, std::stop_token stopToken) -> Result<VerifiedDownload>;
    auto verify(const ComponentSpec& spec, const std::filesystem::path& file) -> Result<std::string>;
    auto unpack(const ComponentSpec& spec,
                const VerifiedDownload& download,
                const std::filesystem::path& staging,
                std::stop_token stopToken) -> VoidResult;
    auto installSdkPackage(const ComponentSpec& spec, std::stop_token stopToken) -> Result<StagedPackage>;
    auto runTool(ProcessSpec spec, std::string_view what, std::stop_token stopToken) -> VoidResult;
};

auto ToolchainProvisioner::Impl::newStagingDirectory(std::string_view id) -> Result<std::filesystem::path>
{
    auto const dir = root() / "staging" / std::format("{}-{}-{}", flatName(id), ::getpid(), stagingCounter.fetch_add(1));
    removeQuietly(dir);
    auto ec = std::error_code {};
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("Cannot create staging directory {}: {}", dir.string(), ec.message()));
    return dir;
}

auto ToolchainProvisioner::Impl::loadLocked() -> Result<ToolchainState*>
{
    if (current)
        return &*current;

    auto ec = std::error_code {};
    if (!std::filesystem::exists(stateFile(), ec))
    {
        log::debug("No toolchain state at {}, starting empty", stateFile().string());
        current = ToolchainState { .root = root() };
        return &*current;
    }

    auto text = fsutil::readTextFile(stateFile());
    if (!text)
        return makeError(ErrorCode::ToolchainInstallError, text.error().message);
    auto parsed = json::parse(*text, ErrorCode::ToolchainInstallError);
    if (!parsed)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("{}: {}", stateFile().string(), parsed.error().message));
    auto loaded = toolchainStateFromJson(*parsed, root());
    if (!loaded)
        return std::unexpected(loaded.error());

    log::debug("Loaded toolchain state: {} component(s), {} license(s)",
               loaded->installed.size(),
               loaded->licenses.size());
    current = std::move(*loaded);
    return &*current;
}

auto ToolchainProvisioner::Impl::commitLocked(ToolchainState candidate) -> VoidResult
{
    if (auto written = fsutil::writeFileAtomically(stateFile(), toJson(candidate).dump(2) + "\n"); !written)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("Cannot persist toolchain state: {}", written.error().message));
    current = std::move(candidate);
    return {};
}

auto ToolchainProvisioner::Impl::writeLicenseFiles(const std::filesystem::path& sdkRoot, const ToolchainState& state)
    -> VoidResult
{
    for (const auto& license: state.licenses)
    {
        auto const hashes = androidLicenseHashes(license.id);
        if (hashes.empty())
            continue;

        auto contents = std::string {};
        for (auto const hash: hashes)
            contents += std::format("\n{}", hash);
        if (auto written = fsutil::writeFileAtomically(sdkRoot / "licenses" / license.id, contents); !written)
            return written;
    }
    return {};
}

auto ToolchainProvisioner::Impl::recordLicenseLocked(std::string_view licenseId) -> VoidResult
{
    auto state = loadLocked();
    if (!state)
        return makeError(ErrorCode::LicenseGateError, state.error().message);
    if ((*state)->hasLicense(licenseId))
        return {};

    auto candidate = **state;
    candidate.licenses.push_back(LicenseAcceptance { .id = std::string(licenseId), .acceptedAt = utcTimestamp() });

    if (auto written = writeLicenseFiles(candidate.sdkRoot(), candidate); !written)
        return makeError(ErrorCode::LicenseGateError,
                         std::format("Cannot record acceptance of '{}': {}", licenseId, written.error().message));
    if (auto committed = commitLocked(std::move(candidate)); !committed)
        return makeError(ErrorCode::LicenseGateError,
                         std::format("Cannot record acceptance of '{}': {}", licenseId, committed.error().message));

    log::info("Recorded acceptance of license '{}'", licenseId);
    return {};
}

auto ToolchainProvisioner::Impl::verify(const ComponentSpec& spec, const std::filesystem::path& file)
    -> Result<std::string>
{
    auto size = checksum::fileSize(file);
    if (!size)
        return std::unexpected(size.error());
    if (spec.size && *size != *spec.size)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("Size mismatch for {}: expected {} bytes, got {}", spec.id, *spec.size, *size));

    auto digest = checksum::sha256File(file);
    if (!digest)
        return std::unexpected(digest.error());
    if (spec.sha256)
    {
        auto expected = *spec.sha256;
        std::ranges::transform(expected, expected.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (*digest != expected)
            return makeError(ErrorCode::ToolchainInstallError,
                             std::format("Checksum mismatch for {}: expected {}, got {}", spec.id, expected, *digest));
    }
    return digest;
}

auto ToolchainProvisioner::Impl::downloadVerified(const ComponentSpec& spec, std::stop_token stopToken)
    -> Result<VerifiedDownload>
{
    if (spec.url.empty())
        return makeError(ErrorCode::ToolchainInstallError, std::format("Component {} has no download URL", spec.id));

    auto const target = root() / "downloads" / std::format("{}-{}-{}", flatName(spec.id), spec.version, downloadFileName(spec));
    auto const attempts = std::max(1, config.downloadAttempts);
    auto lastError = std::string {};

    for (auto attempt = 1; attempt <= attempts; ++attempt)
    {
        if (stopToken.stop_requested())
            return cancelled(std::format("Download of {}", spec.id));

        removeQuietly(target);
        if (auto fetched = fetcher.fetch(spec.url, target, stopToken); !fetched)
        {
            if (fetched.error().isCancellation() || stopToken.stop_requested())
            {
                removeQuietly(target);
                return cancelled(std::format("Download of {}", spec.id));
            }
            lastError = fetched.error().message;
        }
        else if (auto digest = verify(spec, target); !digest)
        {
            lastError = digest.error().message;
        }
        else
        {
            return VerifiedDownload { .file = target, .sha256 = std::move(*digest) };
        }

        log::warning("Attempt {}/{} for {} {} failed: {}", attempt, attempts, spec.id, spec.version, lastError);
        removeQuietly(target);
    }

    return makeError(ErrorCode::ToolchainInstallError,
                     std::format("Cannot install {} {} after {} attempt(s): {}", spec.id, spec.version, attempts, lastError));
}

auto ToolchainProvisioner::Impl::runTool(ProcessSpec spec, std::string_view what, std::stop_token stopToken)
    -> VoidResult
{
    auto tail = LogTail { 4096 };
    auto outcome = runProcess(spec,
                              RunOptions { .timeout = config.installTimeout },
                              [&](std::string_view chunk) { tail.append(chunk); },
                              stopToken);
    if (!outcome)
        return makeError(ErrorCode::ToolchainInstallError, std::format("{}: {}", what, outcome.error().message));
    if (outcome->cancelled)
        return cancelled(what);
    if (outcome->timedOut)
        return makeError(ErrorCode::ToolchainInstallError, std::format("{} timed out", what));
    if (outcome->exitCode != 0)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("{} failed with exit code {}:\n{}", what, outcome->exitCode, tail.text()));
    return {};
}

auto ToolchainProvisioner::Impl::unpack(const ComponentSpec& spec,
                                        const VerifiedDownload& download,
                                        const std::filesystem::path& staging,
                                        std::stop_token stopToken) -> VoidResult
{
    if (spec.kind == InstallKind::File)
    {
        auto ec = std::error_code {};
        std::filesystem::rename(download.file, staging / downloadFileName(spec), ec);
        if (ec)
            return makeError(ErrorCode::ToolchainInstallError,
                             std::format("Cannot stage {}: {}", download.file.string(), ec.message()));
        return {};
    }

    auto const zip = isZip(spec.url);
    auto const tool = findInSearchPath(zip ? "unzip" : "tar", systemSearchPath());
    if (!tool)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("'{}' is required to unpack {}", zip ? "unzip" : "tar", spec.id));

    auto process = ProcessSpec {
        .executable = *tool,
        .args = zip ? std::vector<std::string> { "-q", "-o", download.file.string(), "-d", staging.string() }
                    : std::vector<std::string> { "-xf", download.file.string(), "-C", staging.string() },
        .env = { { "PATH", std::string(systemSearchPath()) } },
        .workingDirectory = staging,
    };
    if (auto ran = runTool(std::move(process), std::format("Unpacking {}", spec.id), stopToken); !ran)
        return ran;

    removeQuietly(download.file);
    return {};
}

auto ToolchainProvisioner::Impl::installSdkPackage(const ComponentSpec& spec, std::stop_token stopToken)
    -> Result<StagedPackage>
{
    auto const& state = *current;
    auto const* cmdline = state.latest(CmdlineToolsComponentId);
    auto const* jdk = state.latest(JdkComponentId);
    if (!cmdline || !jdk)
        return makeError(ErrorCode::ToolchainInstallError,
                         std::format("Installing {} needs the {} and {} components first",
                                     spec.id,
                                     CmdlineToolsComponentId,
                                     JdkComponentId));

    auto const sdkmanager = cmdline->path / "bin" / "sdkmanager";
    auto const attempts = std::max(1, config.downloadAttempts);
    auto lastError = std::string {};

    for (auto attempt = 1; attempt <= attempts; ++attempt)
    {
        if (stopToken.stop_requested())
            return cancelled(std::format("Installation of {}", spec.id));

        auto staging = newStagingDirectory(spec.id);
        if (!staging)
            return std::unexpected(staging.error());
        auto const stagingSdk = *staging / "sdk";
        if (auto licensed = writeLicenseFiles(stagingSdk, state); !licensed)
            return makeError(ErrorCode::ToolchainInstallError, licensed.error().message);

        auto process = ProcessSpec {
            .executable = sdkmanager,
            .args = { std::format("--sdk_root={}", stagingSdk.string()), "--install", spec.id },
            .env = {
                { "JAVA_HOME", jdk->path.string() },
                { "PATH", std::format("{}:{}", (jdk->path / "bin").string(), systemSearchPath()) },
                { "HOME", (*staging / "home").string() },
                { "ANDROID_USER_HOME", (*staging / "home" / ".android").string() },
            },
            .workingDirectory = *staging,
            .stdinData = std::string(LicenseAnswers),
        };

        auto ran = runTool(std::move(process), std::format("sdkmanager --install {}", spec.id), stopToken);
        if (!ran && ran.error().isCancellation())
        {
            removeQuietly(*staging);
            return std::unexpected(ran.error());
        }

        auto const packageDir = stagingSdk / sdkPackagePath(spec.id);
        if (!ran)
            lastError = ran.error().message;
        else if (!std::filesystem::is_regular_file(packageDir / "package.xml"))
            lastError = std::format("sdkmanager did not produce {}", packageDir.string());
        else
            return StagedPackage { .stagingDir = *staging, .packageDir = packageDir };

        log::warning("Attempt {}/{} for {} failed: {}", attempt, attempts, spec.id, lastError);
        removeQuietly(*staging);
    }

    return makeError(ErrorCode::ToolchainInstallError,
                     std::format("Cannot install {} after {} attempt(s): {}", spec.id, attempts, lastError));
}

auto ToolchainProvisioner::Impl::installLocked(const ComponentSpec& spec, std::stop_token stopToken) -> VoidResult
{
    log::info("Installing {} {}", spec.id, spec.version);

    auto destination = std::filesystem::path {};
    auto staged = std::filesystem::path {};
    auto stagingDir = std::optional<std::filesystem::path> {};
    auto digest = std::string {};

    if (spec.kind == InstallKind::SdkPackage)
    {
        auto package = installSdkPackage(spec, stopToken);
        if (!package)
            return std::unexpected(package.error());
        staged = package->packageDir;
        stagingDir = package->stagingDir;
        destination = current->sdkRoot() / sdkPackagePath(spec.id);
    }
    else
    {
        auto download = downloadVerified(spec, stopToken);
        if (!download)
            return std::unexpected(download.error());
        digest = download->sha256;

        auto staging = newStagingDirectory(spec.id);
        if (!staging)
        {
            removeQuietly(download->file);
            return std::unexpected(staging.error());
        }
        stagingDir = *staging;

        if (auto unpacked = unpack(spec, *download, *staging, stopToken); !unpacked)
        {
            removeQuietly(*staging);
            removeQuietly(download->file);
            return unpacked;
        }
        staged = spec.kind == InstallKind::File ? *staging : contentRoot(*staging);
        destination = root() / "components" / flatName(spec.id) / spec.version;
    }

    if (stopToken.stop_requested())
    {
        removeQuietly(*stagingDir);
        return cancelled(std::format("Installation of {}", spec.id));
    }

    if (auto moved = moveIntoPlace(staged, destination); !moved)
    {
        removeQuietly(*stagingDir);
        return moved;
    }
    removeQuietly(*stagingDir);

    auto candidate = *current;
    auto record = InstalledComponent {
        .id = spec.id,
        .version = spec.version,
        .path = destination,
        .sha256 = digest,
        .installedAt = utcTimestamp(),
    };
    if (auto const* existing = candidate.find(spec.id, spec.version); existing && existing->path == destination)
    {
        // The directory had vanished; the existing record describes the reinstalled copy.
        log::info("Reinstalled {} {} at its recorded location", spec.id, spec.version);
        return {};
    }
    if (auto const* newest = candidate.latest(spec.id); newest && compareVersions(spec.version, newest->version) < 0)
        log::info("Installing {} {} next to newer version {}", spec.id, spec.version, newest->version);

    candidate.installed.push_back(std::move(record));
    if (auto committed = commitLocked(std::move(candidate)); !committed)
    {
        // Leave no unrecorded copy behind that a later call would have to discard.
        removeQuietly(destination);
        return committed;
    }

    log::info("Installed {} {} at {}", spec.id, spec.version, destination.string());
    return {};
}

ToolchainProvisioner::ToolchainProvisioner(ProvisionerConfig config, Fetcher& fetcher):
    _impl(std::make_unique<Impl>(std::move(config), fetcher))
{
    auto ec = std::error_code {};
    auto absolute = std::filesystem::absolute(_impl->config.root, ec);
    if (!ec)
        _impl->config.root = absolute.lexically_normal();
}

ToolchainProvisioner::~ToolchainProvisioner() = default;

auto ToolchainProvisioner::ensureReady(std::span<const ComponentSpec> components, std::stop_token stopToken)
    -> Result<ToolchainState>
{
    auto const lock = std::lock_guard { _impl->mutex };

    auto loaded = _impl->loadLocked();
    if (!loaded)
        return std::unexpected(loaded.error());

    for (const auto& spec: components)
    {
        if (stopToken.stop_requested())
            return cancelled("Provisioning");

        if (auto const* installed = _impl->current->find(spec.id, spec.version))
        {
            auto ec = std::error_code {};
            if (std::filesystem::exists(installed->path, ec))
            {
                log::debug("{} {} already installed", spec.id, spec.version);
                continue;
            }
            log::warning("{} {} is recorded but {} is missing", spec.id, spec.version, installed->path.string());
        }

        if (!spec.license.empty() && !_impl->current->hasLicense(spec.license))
        {
            if (!_impl->config.acceptLicenses)
                return makeError(ErrorCode::LicenseGateError,
                                 std::format("{} requires accepting the '{}' license; enable toolchain.acceptLicenses "
                                             "or run 'provision --accept-licenses'",
                                             spec.id,
                                             spec.license));
            if (auto recorded = _impl->recordLicenseLocked(spec.license); !recorded)
                return std::unexpected(recorded.error());
        }

        if (auto installed = _impl->installLocked(spec, stopToken); !installed)
            return std::unexpected(installed.error());
    }

    return *_impl->current;
}

auto ToolchainProvisioner::acceptLicense(std::string_view licenseId) -> Result<ToolchainState>
{
    auto const lock = std::lock_guard { _impl->mutex };
    if (auto recorded = _impl->recordLicenseLocked(licenseId); !recorded)
        return std::unexpected(recorded.error());
    return *_impl->current;
}

auto ToolchainProvisioner::state() -> Result<ToolchainState>
{
    auto const lock = std::lock_guard { _impl->mutex };
    auto loaded = _impl->loadLocked();
    if (!loaded)
        return std::unexpected(loaded.error());
    return **loaded;
}

auto ToolchainProvisioner::stateFilePath() const -> std::filesystem::path
{
    return _impl->stateFile();
}

} // namespace apkforge
