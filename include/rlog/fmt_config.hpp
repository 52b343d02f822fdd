/**
 * @file fmt_config.hpp
 * @brief Pulls in fmt in header-only mode
 * @author rlog contributors
 * @copyright Copyright (c) 2026 rlog contributors. Licensed under MIT License, see LICENSE for details.
 *
 * rlog ships as headers only, so fmt is used the same way and no fmt library
 * has to be linked by users of the facade.
 */
#pragma once

#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
