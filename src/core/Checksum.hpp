// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace apkforge::checksum
{

/// @brief Computes the SHA-256 digest of a byte string.
/// @return The lower-case hex digest, or an IoError if the digest could not be computed.
[[nodiscard]] auto sha256Hex(std::string_view data) -> Result<std::string>;

/// @brief Computes the SHA-256 digest of a file, streaming it in chunks.
/// @return The lower-case hex digest, or a FileSystemError if the file cannot be read.
[[nodiscard]] auto sha256File(const std::filesystem::path& path) -> Result<std::string>;

/// @brief Returns the size of a regular file in bytes.
[[nodiscard]] auto fileSize(const std::filesystem::path& path) -> Result<std::uint64_t>;

} // namespace apkforge::checksum
