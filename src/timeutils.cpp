/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2018-2024 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2005-2009 Craig Edwards <brain@inspircd.org>
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


#include "ilinebot.h"

#include "ilinebot.h"
#include "timeutils.h"

bool Duration::TryFrom(const std::string& str, unsigned long& duration)
{
	static constexpr std::pair<char, unsigned long> units[] = {
		{ 'w', 7 * 24 * 60 * 60 },
		{ 'd', 24 * 60 * 60 },
		{ 'h', 60 * 60 },
		{ 'm', 60 },
		{ 's', 1 },
	};

	unsigned long total = 0;
	unsigned long number = 0;
	for (const char chr : str)
	{
		if (isdigit(static_cast<unsigned char>(chr)))
		{
			number = number * 10 + (chr - '0');
			continue;
		}

		const char lower = static_cast<char>(tolower(static_cast<unsigned char>(chr)));
		auto unit = std::find_if(std::begin(units), std::end(units), [lower](const auto& u) { return u.first == lower; });
		if (unit == std::end(units))
			return false;

		total += number * unit->second;
		number = 0;
	}

	duration = total + number;
	return true;
}

std::string Time::ToString(time_t ts, const char* format, bool utc)
{
	struct tm parts;
	if (!(utc ? gmtime_r(&ts, &parts) : localtime_r(&ts, &parts)))
		return {};

	char buffer[256];
	const size_t len = strftime(buffer, sizeof(buffer), format ? format : "%a %b %d %Y %H:%M:%S", &parts);
	return std::string(buffer, len);
}
