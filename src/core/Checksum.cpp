// SPDX-License-Identifier: Apache-2.0
#include "Checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <fstream>
#include <memory>

namespace apkforge::checksum
{

namespace
{
    struct DigestContextDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

    auto toHex(const unsigned char* bytes, unsigned length) -> std::string
    {
        auto hex = std::string {};
        hex.reserve(length * 2);
        for (unsigned i = 0; i < length; ++i)
            hex += std::format("{:02x}", bytes[i]);
        return hex;
    }

    auto newSha256Context() -> Result<DigestContext>
    {
        auto ctx = DigestContext { EVP_MD_CTX_new() };
        if (!ctx)
            return makeError(ErrorCode::IoError, "EVP_MD_CTX_new failed");
        if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
            return makeError(ErrorCode::IoError, "EVP_DigestInit_ex(sha256) failed");
        return ctx;
    }

    auto finish(EVP_MD_CTX* ctx) -> Result<std::string>
    {
        auto digest = std::array<unsigned char, EVP_MAX_MD_SIZE> {};
        auto length = 0u;
        if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1)
            return makeError(ErrorCode::IoError, "EVP_DigestFinal_ex failed");
        return toHex(digest.data(), length);
    }
} // namespace

auto sha256Hex(std::string_view data) -> Result<std::string>
{
    auto ctx = newSha256Context();
    if (!ctx)
        return std::unexpected(ctx.error());

    if (EVP_DigestUpdate(ctx->get(), data.data(), data.size()) != 1)
        return makeError(ErrorCode::IoError, "EVP_DigestUpdate failed");
    return finish(ctx->get());
}

auto sha256File(const std::filesystem::path& path) -> Result<std::string>
{
    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
        return makeError(ErrorCode::FileSystemError, std::format("Cannot open file: {}", path.string()));

    auto ctx = newSha256Context();
    if (!ctx)
        return std::unexpected(ctx.error());

    auto buffer = std::array<char, 64 * 1024> {};
    while (file)
    {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto const count = file.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx->get(), buffer.data(), static_cast<size_t>(count)) != 1)
            return makeError(ErrorCode::IoError, "EVP_DigestUpdate failed");
    }
    if (file.bad())
        return makeError(ErrorCode::FileSystemError, std::format("Failed reading file: {}", path.string()));

    return finish(ctx->get());
}

auto fileSize(const std::filesystem::path& path) -> Result<std::uint64_t>
{
    auto ec = std::error_code {};
    auto const size = std::filesystem::file_size(path, ec);
    if (ec)
        return makeError(ErrorCode::FileSystemError,
                         std::format("Cannot stat '{}': {}", path.string(), ec.message()));
    return static_cast<std::uint64_t>(size);
}

} // namespace apkforge::checksum
