/**
 * @file log_version.hpp
 * @brief Version information for the rlog facade
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace rlog
{

// The build sets this from the project version
#ifndef RLOG_VERSION_STRING
    #define RLOG_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = RLOG_VERSION_STRING;

} // namespace rlog
