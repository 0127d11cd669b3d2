/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013, 2022-2023 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2013 Attila Molnar <attilamolnar@hush.com>
 *
 * This file is part of IlineBot.  IlineBot is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General Public
 * License as published by the Free Software Foundation, version 2.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#pragma once

/**
 * @def ATTR_NOT_NULL(...)
 * Enables the compile-time checking of arguments that must never be be null.
 */
#if defined __GNUC__
# define ATTR_NOT_NULL(...) __attribute__((nonnull(__VA_ARGS__)))
#else
# define ATTR_NOT_NULL(...)
#endif

/** @def ILINE_FORMAT(FORMAT, ...)
 * Formats a string with format string checking.
 */
#include <fmt/format.h>

#if defined __cpp_if_constexpr && defined __cpp_return_type_deduction
# include <fmt/compile.h>
# define ILINE_FORMAT(FORMAT, ...) fmt::format(FMT_COMPILE(FORMAT), __VA_ARGS__)
#else
# define ILINE_FORMAT(FORMAT, ...) fmt::format(FMT_STRING(FORMAT), __VA_ARGS__)
#endif

/** The bot core is linked into both the daemon and the test runner so every
 * public symbol is exported with default visibility.
 */
#define CoreExport __attribute__ ((visibility ("default")))
