/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging facade
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>
#include <algorithm>
#include <cctype>
#include <type_traits>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace rlog
{

// Key of the attribute every logger appends to its records
inline constexpr const char *ATTR_KEY_MODULE = "module";

// Module name carried by the default logger
inline constexpr const char *DEFAULT_MODULE_NAME = "default";

// Stored in place of a null C string passed as an attribute value
inline constexpr const char *NULL_STRING_VALUE = "<null>";

/**
 * @brief Concept for types that can be carried as attribute values
 *
 * Handlers render values through fmt, so anything fmt can format is accepted.
 * @tparam T The type to check
 */
template <typename T>
concept loggable = fmt::is_formattable<std::remove_cvref_t<T>>::value;

/**
 * @brief Enumeration of log levels in ascending order of severity
 */
enum class log_level : int8_t
{
    debug = -1, ///< Debugging information
    info  = 0,  ///< General information
    warn  = 1,  ///< Warning messages
    error = 2,  ///< Error messages
};

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return Lowercase name of the level, "unknown" for values outside the enumeration
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    default: return "unknown";
    }
}

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level, or an empty optional if the name is not recognized
 *
 * Recognized values: "debug", "info", "warn", "warning", "error"
 */
inline std::optional<log_level> log_level_from_string(const char *str)
{
    if (!str) return std::nullopt;

    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;

    return std::nullopt;
}

} // namespace rlog

template <> struct fmt::formatter<rlog::log_level> : fmt::formatter<fmt::string_view>
{
    auto format(rlog::log_level level, fmt::format_context &ctx) const
    {
        return fmt::formatter<fmt::string_view>::format(rlog::string_from_log_level(level), ctx);
    }
};
