/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2008 Robin Burchell <robin+git@viroteck.net>
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

/*
 * The numerics which the bot reacts to when they are received from a
 * server. Numerics which are only ever ignored are not listed here.
 */
enum
{
	RPL_WELCOME                     = 1,
	RPL_ISUPPORT                    = 5, // not RFC, extremely common though (defined as RPL_BOUNCE in 2812, widely ignored)

	RPL_STATSLINKINFO               = 211,
	RPL_ENDOFSTATS                  = 219,

	RPL_ENDOFWHO                    = 315,
	RPL_WHOREPLY                    = 352,
	RPL_NAMREPLY                    = 353,

	ERR_ERRONEUSNICKNAME            = 432,
	ERR_NICKNAMEINUSE               = 433,
	ERR_UNAVAILRESOURCE             = 437, // From irc2.

	ERR_NOPRIVILEGES                = 481,
};
