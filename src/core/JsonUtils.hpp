// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace apkforge::json
{

/// @brief Parses a JSON document, returning a Result.
/// @param input The JSON text.
/// @param code The error code to report on malformed input.
/// @return The parsed JSON value or an Error.
[[nodiscard]] inline auto parse(std::string_view input, ErrorCode code = ErrorCode::ConfigError)
    -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the member @p key of @p obj, or nullptr if @p obj is no object or lacks it.
[[nodiscard]] inline auto field(const nlohmann::json& obj, std::string_view key) -> const nlohmann::json*
{
    if (!obj.is_object())
        return nullptr;
    auto const it = obj.find(std::string(key));
    return it == obj.end() ? nullptr : &*it;
}

/// @brief Extracts a required string field.
/// @return The string value or an InvalidArgument error naming the field.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const* value = field(obj, key);
    if (!value || !value->is_string())
        return makeError(ErrorCode::InvalidArgument, std::format("Missing or invalid string field: {}", key));
    return value->get<std::string>();
}

// The getters below return the default for a missing field and for a field of another type.

[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj, std::string_view key, std::string_view defaultValue)
    -> std::string
{
    auto const* value = field(obj, key);
    return value && value->is_string() ? value->get<std::string>() : std::string(defaultValue);
}

[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const* value = field(obj, key);
    return value && value->is_number_integer() ? value->get<int>() : defaultValue;
}

[[nodiscard]] inline auto getUInt64Or(const nlohmann::json& obj, std::string_view key, std::uint64_t defaultValue)
    -> std::uint64_t
{
    auto const* value = field(obj, key);
    return value && value->is_number_unsigned() ? value->get<std::uint64_t>() : defaultValue;
}

[[nodiscard]] inline auto getFloatOr(const nlohmann::json& obj, std::string_view key, float defaultValue) -> float
{
    auto const* value = field(obj, key);
    return value && value->is_number() ? value->get<float>() : defaultValue;
}

[[nodiscard]] inline auto getBoolOr(const nlohmann::json& obj, std::string_view key, bool defaultValue) -> bool
{
    auto const* value = field(obj, key);
    return value && value->is_boolean() ? value->get<bool>() : defaultValue;
}

/// @brief Extracts an array of strings, skipping non-string elements.
[[nodiscard]] inline auto getStringArrayOr(const nlohmann::json& obj,
                                           std::string_view key,
                                           std::vector<std::string> defaultValue) -> std::vector<std::string>
{
    auto const* value = field(obj, key);
    if (!value || !value->is_array())
        return defaultValue;

    auto values = std::vector<std::string> {};
    for (const auto& item: *value)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

} // namespace apkforge::json
