/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013, 2020, 2022-2023 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2012 Attila Molnar <attilamolnar@hush.com>
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

namespace iline
{
	/** Joins the elements of a container with a separator between each. */
	template<typename Collection, typename Separator = char>
	std::string join(const Collection& sequence, Separator separator = ' ')
	{
		std::string joined;
		bool first = true;
		for (const auto& element : sequence)
		{
			if (!first)
				fmt::format_to(std::back_inserter(joined), "{}", separator);
			fmt::format_to(std::back_inserter(joined), "{}", element);
			first = false;
		}
		return joined;
	}

	/** ASCII case insensitive comparison for config values and commands. */
	inline bool equalsci(std::string_view str1, std::string_view str2)
	{
		return std::ranges::equal(str1, str2, [](unsigned char c1, unsigned char c2) {
			return ::tolower(c1) == ::tolower(c2);
		});
	}

	/** Strips whitespace from both ends of a string. */
	inline std::string trim(const std::string& str)
	{
		static constexpr const char* whitespace = " \t\r\n\v\f";
		const size_t first = str.find_first_not_of(whitespace);
		if (first == std::string::npos)
			return {};

		return str.substr(first, str.find_last_not_of(whitespace) - first + 1);
	}

	inline std::string tolower(std::string str)
	{
		std::ranges::transform(str, str.begin(), [](unsigned char chr) { return static_cast<char>(::tolower(chr)); });
		return str;
	}
}
