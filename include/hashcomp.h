/*
 * IlineBot -- IRCnet I-line lookup bot
 *
 *   Copyright (C) 2025-2026 The IlineBot Developers
 *   Copyright (C) 2013, 2015-2016, 2018-2023 Sadie Powell <sadie@witchery.services>
 *   Copyright (C) 2009 Daniel De Graaf <danieldg@inspircd.org>
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



#pragma once

/** Helpers for the strings which IRC servers send us. Nicknames and
 * channel names compare using RFC 1459 casemapping where [ ] \ ^ are
 * the upper case forms of { } | ~.
 */
namespace irc
{
	/** Lowers a character using RFC 1459 casemapping. */
	constexpr unsigned char tolower(unsigned char chr)
	{
		if ((chr >= 'A' && chr <= 'Z') || chr == '[' || chr == ']' || chr == '\\' || chr == '^')
			return chr + 32;
		return chr;
	}

	/** Determines whether two nicknames or channel names are the same. */
	CoreExport bool equals(std::string_view s1, std::string_view s2);

	/** Orders strings by their RFC 1459 lower case form for use as a map comparator. */
	struct CoreExport insensitive_swo final
	{
		bool operator()(const std::string& a, const std::string& b) const;
	};

	/** Splits a string on a separator, one token per call to GetToken(). */
	class CoreExport sepstream
	{
		const std::string tokens;
		const char sep;
		const bool allow_empty;
		size_t pos = 0;

	public:
		/** @param allowempty Whether adjacent separators yield an empty token. */
		sepstream(const std::string& source, char separator, bool allowempty = false);

		/** Reads the next token.
		 * @return False once the string has been used up.
		 */
		bool GetToken(std::string& token);
	};

	class CoreExport commasepstream final
		: public sepstream
	{
	public:
		commasepstream(const std::string& source, bool allowempty = false)
			: sepstream(source, ',', allowempty)
		{
		}
	};

	class CoreExport spacesepstream final
		: public sepstream
	{
	public:
		spacesepstream(const std::string& source, bool allowempty = false)
			: sepstream(source, ' ', allowempty)
		{
		}
	};

	/** Reads the parameters of an RFC 1459 message. A parameter starting
	 * with a colon consumes the rest of the line when read with GetTrailing().
	 */
	class CoreExport tokenstream final
	{
		const std::string message;
		size_t position = 0;

	public:
		tokenstream(const std::string& msg);

		/** Reads the next space separated parameter. */
		bool GetMiddle(std::string& token);

		/** Reads the next parameter, which may be a trailing one. */
		bool GetTrailing(std::string& token);
	};
}
