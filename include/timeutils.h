/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2020-2023 Sadie Powell <sadie@witchery.services>
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


#pragma once

namespace Duration
{
	/** Parses a duration such as "1w2d3h4m5s" into seconds. Digits without
	 * a unit after them are counted as seconds.
	 * @param str The duration to parse.
	 * @param duration Receives the number of seconds on success.
	 * @return False if the string contains anything other than digits and units.
	 */
	CoreExport bool TryFrom(const std::string& str, unsigned long& duration);
}

namespace Time
{
	/** Formats a timestamp using strftime(3). Without a format the output
	 * looks like "Mon Jan 02 2026 15:04:05".
	 */
	CoreExport std::string ToString(time_t ts, const char* format = nullptr, bool utc = false);
}
